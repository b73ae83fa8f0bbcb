#pragma once

#include <veil/schema/ledger_error_code.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

// Schema type: operation result.
// Envelope returned by every ledger operation: a code, the value on success
// and a human-readable log line on failure.
namespace veil::schema {

template <typename T>
struct operation_result final {
  ledger_error_code code{ledger_error_code::ok};
  std::optional<T> value;
  std::string log;

  bool ok() const { return code == ledger_error_code::ok; }
};

template <>
struct operation_result<void> final {
  ledger_error_code code{ledger_error_code::ok};
  std::string log;

  bool ok() const { return code == ledger_error_code::ok; }
};

template <typename T>
operation_result<T> make_success(T value) {
  return operation_result<T>{.code = ledger_error_code::ok,
                             .value = std::move(value),
                             .log = {}};
}

inline operation_result<void> make_success() {
  return operation_result<void>{};
}

template <typename T>
operation_result<T> make_failure(const ledger_error_code code,
                                 std::string log) {
  if constexpr (std::is_void_v<T>) {
    return operation_result<void>{.code = code, .log = std::move(log)};
  } else {
    return operation_result<T>{
        .code = code, .value = std::nullopt, .log = std::move(log)};
  }
}

/// Re-tag a failed result for a different value type.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failed) {
  return make_failure<T>(failed.code, failed.log);
}

}  // namespace veil::schema
