#pragma once

#include <veil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: submission status.
// Review lifecycle set by the submitter: pending until verified or rejected.
namespace veil::schema {

enum class submission_status_t : uint8_t {
  pending = 0,
  verified = 1,
  rejected = 2
};

inline constexpr auto kSubmissionStatusMappings =
    std::array{std::pair<std::string_view, submission_status_t>{
                   "pending", submission_status_t::pending},
               std::pair<std::string_view, submission_status_t>{
                   "verified", submission_status_t::verified},
               std::pair<std::string_view, submission_status_t>{
                   "rejected", submission_status_t::rejected}};

template <>
inline std::optional<submission_status_t> try_from_string<submission_status_t>(
    const std::string_view value) {
  return from_string(value, kSubmissionStatusMappings);
}

inline constexpr std::string_view to_string(const submission_status_t value) {
  return to_string(value, kSubmissionStatusMappings).value_or("unknown");
}

}  // namespace veil::schema
