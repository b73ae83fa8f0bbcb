#pragma once
#include <veil/schema/primitives.hpp>
#include <veil/schema/request_kind.hpp>
#include <string>
#include <variant>

namespace veil::schema {

struct submission_ref final {
  submission_id_t submission_id{};
};

struct bucket_ref final {
  std::string category;
};

using request_target_t = std::variant<submission_ref, bucket_ref>;

/// The only kind a target of this shape may be issued under.
inline request_kind_t expected_kind(const request_target_t& target) {
  return std::holds_alternative<submission_ref>(target)
             ? request_kind_t::submission_reveal
             : request_kind_t::bucket_count_reveal;
}

std::string describe(const request_target_t& target);

}  // namespace veil::schema
