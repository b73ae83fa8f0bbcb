#pragma once

#include <spdlog/common.h>
#include <veil/schema/aggregation_mode.hpp>

#include <optional>
#include <string>

namespace veil::config {

/// Runtime settings for the veild daemon.
struct ledger_options final {
  std::string db_path{"veil.db"};
  veil::schema::aggregation_mode_t aggregation_mode{
      veil::schema::aggregation_mode_t::count};
  // Created with fresh keys when missing.
  std::string key_file{"veil.key"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  // Empty keeps logging on the console only.
  std::string log_file;
  bool show_help{};
  std::string help_text;
};

/// Parse the command line, then the optional `--config` file.
///
/// Command-line values win over the config file. On failure returns
/// std::nullopt and sets `error`.
std::optional<ledger_options> parse_options(int argc,
                                            const char* const argv[],
                                            std::string& error);

}  // namespace veil::config
