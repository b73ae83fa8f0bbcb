#pragma once
#include <veil/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace veil::blake3 {

veil::schema::hash32_t hash(const std::string_view& str);
veil::schema::hash32_t hash(const veil::schema::bytes_view_t& bytes);

}  // namespace veil::blake3
