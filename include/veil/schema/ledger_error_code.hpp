#pragma once

#include <veil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: ledger error code.
// Stable numeric codes for every expected failure of the ledger surface.
namespace veil::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  not_found = 1,
  already_revealed = 2,
  already_pending = 3,
  already_folded = 4,
  proof_verification_failed = 5,
  unauthorized = 6,
  unknown_request = 7,
  invalid_argument = 8,
  invalid_state = 9,
  type_mismatch = 10,
  oracle_unavailable = 11,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{"ok", ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "not_found", ledger_error_code::not_found},
    std::pair<std::string_view, ledger_error_code>{
        "already_revealed", ledger_error_code::already_revealed},
    std::pair<std::string_view, ledger_error_code>{
        "already_pending", ledger_error_code::already_pending},
    std::pair<std::string_view, ledger_error_code>{
        "already_folded", ledger_error_code::already_folded},
    std::pair<std::string_view, ledger_error_code>{
        "proof_verification_failed",
        ledger_error_code::proof_verification_failed},
    std::pair<std::string_view, ledger_error_code>{
        "unauthorized", ledger_error_code::unauthorized},
    std::pair<std::string_view, ledger_error_code>{
        "unknown_request", ledger_error_code::unknown_request},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_argument", ledger_error_code::invalid_argument},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_state", ledger_error_code::invalid_state},
    std::pair<std::string_view, ledger_error_code>{
        "type_mismatch", ledger_error_code::type_mismatch},
    std::pair<std::string_view, ledger_error_code>{
        "oracle_unavailable", ledger_error_code::oracle_unavailable}};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

}  // namespace veil::schema
