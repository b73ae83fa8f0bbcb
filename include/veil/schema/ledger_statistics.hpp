#pragma once

#include <cstdint>

namespace veil::schema {

struct ledger_statistics final {
  uint64_t total{};
  uint64_t pending{};
  uint64_t verified{};
  uint64_t rejected{};
  uint64_t revealed{};
};

}  // namespace veil::schema
