#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "engine/core/eval_key.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::physics {

// Memoization of evaluate(inputs, config).
// - Content-addressed by EvalKey (inputs + physics-relevant config).
// - Bounded memory via LRU eviction.
// - Thread-safe; concurrent misses on the same key may both compute and both
//   put: last writer wins, and both values are identical by construction.

struct CacheStats final {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t inserts = 0;
  std::uint64_t evictions = 0;
};

class EvalCache final {
 public:
  explicit EvalCache(std::size_t max_entries = 4096);

  void set_max_entries(std::size_t n);
  std::size_t max_entries() const noexcept;
  std::size_t size() const noexcept;

  void clear();

  CacheStats stats() const;

  std::optional<OutputMap> get(const EvalKey& key);
  void put(const EvalKey& key, OutputMap value);

 private:
  struct Node final {
    EvalKey key{};
    OutputMap value{};
  };

  using List = std::list<Node>;
  using Map = std::unordered_map<EvalKey, List::iterator, EvalKeyHash>;

  void evict_to_capacity_();

  mutable std::mutex mtx_;
  std::size_t max_entries_ = 4096;

  CacheStats stats_{};

  List lru_;
  Map index_;
};

}  // namespace fusion::physics
