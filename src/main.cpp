#include <spdlog/spdlog.h>
#include <veil/common/logging.hpp>
#include <veil/config/options.hpp>
#include <veil/daemon/session.hpp>
#include <veil/ledger/confidential_ledger.hpp>
#include <veil/oracle/local_engine.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

std::optional<veil::oracle::engine_keys> load_or_create_keys(
    const std::string& path) {
  if (std::filesystem::exists(path)) {
    spdlog::info("Loading engine keys from '{}'", path);
    return veil::oracle::load_engine_keys(path);
  }
  spdlog::warn("Key file '{}' not found; generating a new one", path);
  auto keys = veil::oracle::generate_engine_keys();
  if (!keys) {
    return std::nullopt;
  }
  if (!veil::oracle::save_engine_keys(path, *keys)) {
    spdlog::error("Failed to write key file '{}'", path);
    return std::nullopt;
  }
  return keys;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = veil::config::parse_options(argc, argv, error);
  if (!options) {
    std::cerr << "veild: " << error << std::endl;
    return 2;
  }
  if (options->show_help) {
    std::cout << options->help_text << std::endl;
    return 0;
  }

  veil::common::configure_logging(options->log_level, options->log_file);
  spdlog::info("Starting veild with RocksDB path '{}' in {} mode",
               options->db_path, to_string(options->aggregation_mode));

  auto keys = load_or_create_keys(options->key_file);
  if (!keys) {
    spdlog::critical("No usable engine keys; exiting");
    spdlog::shutdown();
    return 1;
  }

  auto encoder = veil::schema::encoding::scale_encoder_t{};
  auto storage =
      veil::storage::make_storage<veil::storage::rocksdb_storage_tag>(
          options->db_path);
  auto engine = veil::oracle::local_engine{*keys};
  auto ledger = veil::ledger::confidential_ledger{
      encoder, storage, engine.bind(), options->aggregation_mode};
  engine.set_callback([&](const veil::schema::request_token_t& token,
                          const veil::oracle::cleartexts_t& cleartexts,
                          const veil::schema::bytes_t& proof) {
    auto result = ledger.on_decryption_result(token, cleartexts, proof);
    if (!result.ok()) {
      spdlog::warn("Decryption callback rejected: {}", result.log);
    } else if (result.value->fold_code != veil::schema::ledger_error_code::ok) {
      spdlog::warn("Revealed submission was not aggregated ({}): {}",
                   to_string(result.value->fold_code), result.value->fold_log);
    }
  });

  auto session = veil::daemon::session{ledger, engine, std::cout};
  auto line = std::string{};
  std::cout << "veil> " << std::flush;
  while (std::getline(std::cin, line)) {
    if (!session.execute(line)) {
      break;
    }
    std::cout << "veil> " << std::flush;
  }

  spdlog::info("veild shutting down");
  spdlog::shutdown();
  return 0;
}
