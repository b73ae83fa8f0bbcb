#include <veil/schema/request_target.hpp>

#include <spdlog/fmt/fmt.h>

namespace veil::schema {

std::string describe(const request_target_t& target) {
  return std::visit(
      overloaded{[](const submission_ref& value) {
                   return fmt::format("submission {}", value.submission_id);
                 },
                 [](const bucket_ref& value) {
                   return fmt::format("bucket '{}'", value.category);
                 }},
      target);
}

}  // namespace veil::schema
