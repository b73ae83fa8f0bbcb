#pragma once

#include <veil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: aggregation mode.
// count folds an encrypted 1 per submission; sum folds the encrypted payload.
namespace veil::schema {

enum class aggregation_mode_t : uint8_t { count = 0, sum = 1 };

inline constexpr auto kAggregationModeMappings =
    std::array{std::pair<std::string_view, aggregation_mode_t>{
                   "count", aggregation_mode_t::count},
               std::pair<std::string_view, aggregation_mode_t>{
                   "sum", aggregation_mode_t::sum}};

template <>
inline std::optional<aggregation_mode_t> try_from_string<aggregation_mode_t>(
    const std::string_view value) {
  return from_string(value, kAggregationModeMappings);
}

inline constexpr std::string_view to_string(const aggregation_mode_t value) {
  return to_string(value, kAggregationModeMappings).value_or("unknown");
}

}  // namespace veil::schema
