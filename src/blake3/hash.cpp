#include <blake3.h>
#include <veil/blake3/hash.hpp>

namespace veil::blake3 {

namespace {

veil::schema::hash32_t finalize(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<veil::schema::hash32_t>);
  auto output = veil::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

veil::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

veil::schema::hash32_t hash(const veil::schema::bytes_view_t& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace veil::blake3
