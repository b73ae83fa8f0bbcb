#pragma once
#include <veil/schema/category_bucket.hpp>
#include <veil/schema/ledger_error_code.hpp>
#include <veil/schema/request_kind.hpp>
#include <veil/schema/request_target.hpp>
#include <optional>
#include <string>

namespace veil::schema {

/// What an applied decryption callback changed.
struct decryption_outcome final {
  request_kind_t kind{};
  request_target_t target;
  // Set for bucket_count_reveal.
  std::optional<bucket_count> revealed_count;
  // For submission_reveal: whether the revealed submission reached its
  // category bucket. The reveal itself stands either way.
  ledger_error_code fold_code{ledger_error_code::ok};
  std::string fold_log;
};

}  // namespace veil::schema
