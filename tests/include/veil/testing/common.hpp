#pragma once

#include <veil/oracle/local_engine.hpp>
#include <veil/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace veil::testing {

inline veil::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = veil::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic engine keys so proofs are reproducible across a reopen.
inline veil::oracle::engine_keys make_engine_keys(const uint8_t seed) {
  auto keys = veil::oracle::engine_keys{};
  for (std::size_t i = 0; i < keys.sealing_key.size(); ++i) {
    keys.sealing_key[i] = static_cast<uint8_t>(seed + i);
    keys.signing_key[i] = static_cast<uint8_t>((seed * 7) + i);
  }
  return keys;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace veil::testing
