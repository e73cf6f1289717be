#include "engine/physics/eval_cache.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace fusion::physics {

EvalCache::EvalCache(std::size_t max_entries) : max_entries_(std::max<std::size_t>(1, max_entries)) {}

void EvalCache::set_max_entries(std::size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  max_entries_ = std::max<std::size_t>(1, n);
  evict_to_capacity_();
}

std::size_t EvalCache::max_entries() const noexcept {
  std::lock_guard<std::mutex> lk(mtx_);
  return max_entries_;
}

std::size_t EvalCache::size() const noexcept {
  std::lock_guard<std::mutex> lk(mtx_);
  return lru_.size();
}

void EvalCache::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  lru_.clear();
  index_.clear();
  stats_ = CacheStats{};
}

CacheStats EvalCache::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

std::optional<OutputMap> EvalCache::get(const EvalKey& key) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = index_.find(key);
  if (it == index_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second);
  ++stats_.hits;
  return it->second->value;
}

void EvalCache::put(const EvalKey& key, OutputMap value) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = index_.find(key);
  if (it != index_.end()) {
    it->second->value = std::move(value);
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }

  lru_.push_front(Node{key, std::move(value)});
  index_[key] = lru_.begin();
  ++stats_.inserts;
  evict_to_capacity_();
}

void EvalCache::evict_to_capacity_() {
  while (lru_.size() > max_entries_) {
    auto last_it = std::prev(lru_.end());
    index_.erase(last_it->key);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

}  // namespace fusion::physics
