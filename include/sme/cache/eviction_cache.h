#pragma once

#include "sme/core/clock.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace sme::cache {

struct CacheConfig {
  std::size_t capacity{1000};
  core::Millis ttl{std::chrono::minutes{5}};
};

struct CacheStats {
  std::size_t size{0};
  std::size_t capacity{0};
  std::size_t hits{0};
  std::size_t misses{0};
  std::size_t expirations{0};
  std::size_t evictions{0};
  double hit_rate{0.0};
  double average_access_count{0.0};
};

// EvictionCache is a bounded key→value store with lazy TTL expiry and value-based
// eviction.
//
// - get(): an entry older than ttl is deleted and reported absent. A live hit
//   increments the access count; the creation timestamp is not reset.
// - set(): a new key arriving at capacity first evicts the entry with the lowest
//   access_count / (age_ms + 1), i.e. the least frequently and least recently useful
//   entry. Ties go to the first entry in key order. Re-setting an existing key
//   refreshes value, timestamp and access count without an eviction scan.
//
// Thread-safety: every operation takes one std::mutex, so concurrent get/set on the
// same key cannot lose updates during an eviction scan.
template <typename K, typename V>
class EvictionCache {
 public:
  EvictionCache(CacheConfig config, const core::IClock& clock)
      : config_(config), clock_(clock) {
    if (config_.capacity == 0) {
      throw std::invalid_argument("EvictionCache capacity must be positive");
    }
    if (config_.ttl <= core::Millis{0}) {
      throw std::invalid_argument("EvictionCache ttl must be positive");
    }
  }

  ~EvictionCache() = default;

  // Not copyable or movable (contains mutex, holds a clock reference)
  EvictionCache(const EvictionCache&) = delete;
  EvictionCache& operator=(const EvictionCache&) = delete;
  EvictionCache(EvictionCache&&) = delete;
  EvictionCache& operator=(EvictionCache&&) = delete;

  [[nodiscard]] std::optional<V> get(const K& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();

    auto it = entries_.find(key);
    if (it == entries_.end()) {
      ++misses_;
      return std::nullopt;
    }
    if (is_expired(it->second, now)) {
      entries_.erase(it);
      ++expirations_;
      ++misses_;
      return std::nullopt;
    }

    ++it->second.access_count;
    ++hits_;
    return it->second.value;
  }

  void set(const K& key, V value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();

    auto it = entries_.find(key);
    if (it != entries_.end()) {
      it->second = Entry{std::move(value), now, 1};
      return;
    }

    if (entries_.size() >= config_.capacity) {
      evict_least_valuable(now);
    }
    entries_.emplace(key, Entry{std::move(value), now, 1});
  }

  // contains() does not count as an access and does not touch hit/miss counters.
  [[nodiscard]] bool contains(const K& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    return it != entries_.end() && !is_expired(it->second, clock_.now());
  }

  bool erase(const K& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

  // purge_expired sweeps every stale entry now instead of waiting for the next read.
  // Observable results are identical to lazy expiry; returns the number removed.
  std::size_t purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (is_expired(it->second, now)) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    expirations_ += removed;
    return removed;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  [[nodiscard]] std::size_t capacity() const { return config_.capacity; }
  [[nodiscard]] core::Millis ttl() const { return config_.ttl; }

  [[nodiscard]] CacheStats stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = entries_.size();
    stats.capacity = config_.capacity;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.expirations = expirations_;
    stats.evictions = evictions_;
    const std::size_t lookups = hits_ + misses_;
    stats.hit_rate =
        lookups > 0 ? static_cast<double>(hits_) / static_cast<double>(lookups) : 0.0;
    if (!entries_.empty()) {
      std::size_t total = 0;
      for (const auto& [key, entry] : entries_) {
        total += entry.access_count;
      }
      stats.average_access_count =
          static_cast<double>(total) / static_cast<double>(entries_.size());
    }
    return stats;
  }

 private:
  struct Entry {
    V value;
    core::Timestamp created_at;
    std::size_t access_count{1};
  };

  [[nodiscard]] bool is_expired(const Entry& entry, const core::Timestamp now) const {
    return now - entry.created_at > config_.ttl;
  }

  // Caller holds mutex_.
  void evict_least_valuable(const core::Timestamp now) {
    auto victim = entries_.end();
    double min_score = std::numeric_limits<double>::infinity();

    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      const auto age = std::chrono::duration_cast<core::Millis>(now - it->second.created_at);
      const double age_ms = static_cast<double>(std::max<core::Millis::rep>(age.count(), 0));
      const double score = static_cast<double>(it->second.access_count) / (age_ms + 1.0);
      if (score < min_score) {
        min_score = score;
        victim = it;
      }
    }

    if (victim != entries_.end()) {
      entries_.erase(victim);
      ++evictions_;
    }
  }

  CacheConfig config_;
  const core::IClock& clock_;

  mutable std::mutex mutex_;
  std::map<K, Entry> entries_;
  std::size_t hits_{0};
  std::size_t misses_{0};
  std::size_t expirations_{0};
  std::size_t evictions_{0};
};

}  // namespace sme::cache
