#pragma once
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/schema/submission_status.hpp>
#include <optional>
#include <string>

namespace veil::schema {

template <uint16_t Version>
struct submission_state;

template <>
struct submission_state<1> final {
  uint16_t version{1};
  submission_id_t submission_id{};
  ciphertext_t encrypted_payload;
  ciphertext_t encrypted_category;
  principal_id_t owner{};
  timestamp_milliseconds_t created_at{};
  // Public, never encrypted.
  std::string description;
  submission_status_t status{submission_status_t::pending};
  // Write-once; the revealed fields are set iff revealed is true.
  bool revealed{};
  std::optional<bytes_t> revealed_payload;
  std::optional<std::string> revealed_category;
};

using submission_state_t = submission_state<1>;

}  // namespace veil::schema
