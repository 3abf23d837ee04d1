#pragma once

#include "avlink/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace avlink {

class CacheManager;

#ifdef AVLINK_TESTING
namespace test {
std::optional<ParamValue> CacheGetAt(CacheManager& cache,
                                     const std::string& ns,
                                     const std::string& key,
                                     std::chrono::steady_clock::time_point now);
}  // namespace test
#endif

/**
 * A cached value together with its bookkeeping timestamps.
 */
struct CachedValue {
  ParamValue value;
  std::chrono::steady_clock::time_point stored_at;
  std::chrono::steady_clock::time_point expires_at;
};

struct CacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t sets = 0;
  /// Reads that found an entry past its expiry.
  uint64_t expired = 0;
  size_t entries = 0;
};

/**
 * Namespaced key/value store with per-entry TTL.
 *
 * There is no background eviction: expiry is checked when an entry is read,
 * and writes always replace the previous entry. Namespaces are independent
 * key spaces. The cache never fails; it only reports hit or miss.
 */
class CacheManager {
 public:
  CacheManager();
  ~CacheManager();

  CacheManager(const CacheManager&) = delete;
  CacheManager& operator=(const CacheManager&) = delete;

  /// Return the value for (ns, key), or nullopt on miss or expiry.
  std::optional<ParamValue> Get(const std::string& ns, const std::string& key);
  /// Like Get, but also returns the entry timestamps.
  std::optional<CachedValue> GetEntry(const std::string& ns, const std::string& key);
  /// Store a value, replacing any previous entry for (ns, key).
  void Set(const std::string& ns, const std::string& key, ParamValue value,
           std::chrono::milliseconds ttl);
  /// Remove one entry. Returns true if it existed.
  bool Erase(const std::string& ns, const std::string& key);
  /// Remove every entry of a namespace. Returns the number removed.
  size_t ClearNamespace(const std::string& ns);
  /// Drop expired entries now. Returns the number removed.
  size_t Purge();

  CacheStats GetStats() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef AVLINK_TESTING
  friend std::optional<ParamValue> test::CacheGetAt(
      CacheManager& cache, const std::string& ns, const std::string& key,
      std::chrono::steady_clock::time_point now);
#endif
};

}  // namespace avlink
