#pragma once

#include "sme/cache/eviction_cache.h"

#include <functional>
#include <string>
#include <utility>

namespace sme::cache {

// Memoizer wraps a pure function with an EvictionCache. The key function maps the
// arguments to a cache key; two argument lists that produce the same key must produce
// the same result.
template <typename R, typename... Args>
class Memoizer {
 public:
  using Function = std::function<R(const Args&...)>;
  using KeyFunction = std::function<std::string(const Args&...)>;

  Memoizer(Function fn, KeyFunction key_fn, CacheConfig config, const core::IClock& clock)
      : fn_(std::move(fn)), key_fn_(std::move(key_fn)), cache_(config, clock) {}

  R operator()(const Args&... args) {
    const std::string key = key_fn_(args...);
    if (auto cached = cache_.get(key)) {
      return *cached;
    }
    R result = fn_(args...);
    cache_.set(key, result);
    return result;
  }

  [[nodiscard]] CacheStats stats() const { return cache_.stats(); }
  void clear() { cache_.clear(); }

 private:
  Function fn_;
  KeyFunction key_fn_;
  EvictionCache<std::string, R> cache_;
};

}  // namespace sme::cache
