#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace veil::common {

/// Lock-striped hash map.
///
/// Each key hashes to one stripe; a stripe owns its own mutex and bucket of
/// entries. Callers lock the stripe for the key they mutate, so operations on
/// keys in different stripes never contend. Holding a stripe lock while doing
/// a check-and-insert makes that step indivisible for the key.
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          std::size_t StripeCount = 32>
class sharded_map final {
 public:
  struct stripe final {
    mutable std::mutex mutex;
    std::unordered_map<Key, Value, Hash> entries;
  };

  stripe& stripe_for(const Key& key) {
    return stripes_[Hash{}(key) % StripeCount];
  }

  const stripe& stripe_for(const Key& key) const {
    return stripes_[Hash{}(key) % StripeCount];
  }

  /// Visit every entry, locking one stripe at a time.
  ///
  /// The view is not a consistent snapshot across stripes.
  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (const auto& s : stripes_) {
      auto lock = std::scoped_lock{s.mutex};
      for (const auto& [key, value] : s.entries) {
        fn(key, value);
      }
    }
  }

  std::size_t size() const {
    auto total = std::size_t{};
    for (const auto& s : stripes_) {
      auto lock = std::scoped_lock{s.mutex};
      total += s.entries.size();
    }
    return total;
  }

 private:
  std::array<stripe, StripeCount> stripes_;
};

}  // namespace veil::common
