#pragma once

#include <veil/schema/enum_string.hpp>
#include <veil/schema/primitives.hpp>

#include <cstdint>

// Schema type: ciphertext envelope.
// Opaque encrypted value handed to and from the encryption engine. The ledger
// stores and forwards it but never opens, compares or combines it itself; the
// only way to combine two envelopes is the engine's homomorphic add.
namespace veil::schema {

enum class ciphertext_type_t : uint8_t { euint64 = 0, ebytes = 1 };

inline constexpr auto kCiphertextTypeMappings =
    std::array{std::pair<std::string_view, ciphertext_type_t>{
                   "euint64", ciphertext_type_t::euint64},
               std::pair<std::string_view, ciphertext_type_t>{
                   "ebytes", ciphertext_type_t::ebytes}};

template <>
inline std::optional<ciphertext_type_t> try_from_string<ciphertext_type_t>(
    const std::string_view value) {
  return from_string(value, kCiphertextTypeMappings);
}

inline constexpr std::string_view to_string(const ciphertext_type_t value) {
  return to_string(value, kCiphertextTypeMappings).value_or("unknown");
}

template <uint16_t Version>
struct ciphertext_envelope;

template <>
struct ciphertext_envelope<1> final {
  uint16_t version{1};
  ciphertext_type_t type{ciphertext_type_t::euint64};
  bytes_t handle;
};

using ciphertext_t = ciphertext_envelope<1>;

}  // namespace veil::schema
