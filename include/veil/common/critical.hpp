#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace veil::common {

/// Log an unrecoverable fault and bring the process down.
///
/// Reserved for storage, codec and entropy failures that leave the ledger
/// unable to trust its own state. Expected protocol conditions are reported
/// through `operation_result` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// As above, with the lower layer's own account of the failure (a RocksDB
/// status, an OpenSSL error) appended.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace veil::common
