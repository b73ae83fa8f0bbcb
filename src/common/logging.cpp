#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <veil/common/logging.hpp>

#include <memory>
#include <vector>

namespace veil::common {

void configure_logging(const spdlog::level::level_enum level,
                       const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "veil", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace veil::common
