#include "avlink/cache_manager.h"

#include <mutex>
#include <unordered_map>

namespace avlink {

struct CacheManager::Impl {
  using Clock = std::chrono::steady_clock;

  struct Entry {
    ParamValue value;
    Clock::time_point stored_at;
    Clock::time_point expires_at;
  };

  using Namespace = std::unordered_map<std::string, Entry>;

  std::optional<CachedValue> Lookup(const std::string& ns, const std::string& key,
                                    Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto ns_it = spaces.find(ns);
    if (ns_it == spaces.end()) {
      ++stats.misses;
      return std::nullopt;
    }
    auto it = ns_it->second.find(key);
    if (it == ns_it->second.end()) {
      ++stats.misses;
      return std::nullopt;
    }
    if (now >= it->second.expires_at) {
      ++stats.misses;
      ++stats.expired;
      return std::nullopt;
    }
    ++stats.hits;
    CachedValue out;
    out.value = it->second.value;
    out.stored_at = it->second.stored_at;
    out.expires_at = it->second.expires_at;
    return out;
  }

  mutable std::mutex mutex;
  std::unordered_map<std::string, Namespace> spaces;
  CacheStats stats;
};

CacheManager::CacheManager() : impl_(new Impl()) {}

CacheManager::~CacheManager() = default;

std::optional<ParamValue> CacheManager::Get(const std::string& ns,
                                            const std::string& key) {
  auto entry = impl_->Lookup(ns, key, Impl::Clock::now());
  if (!entry.has_value()) {
    return std::nullopt;
  }
  return std::move(entry->value);
}

std::optional<CachedValue> CacheManager::GetEntry(const std::string& ns,
                                                  const std::string& key) {
  return impl_->Lookup(ns, key, Impl::Clock::now());
}

void CacheManager::Set(const std::string& ns, const std::string& key,
                       ParamValue value, std::chrono::milliseconds ttl) {
  const auto now = Impl::Clock::now();
  std::lock_guard<std::mutex> lock(impl_->mutex);
  Impl::Entry& entry = impl_->spaces[ns][key];
  entry.value = std::move(value);
  entry.stored_at = now;
  entry.expires_at = now + (ttl.count() > 0 ? ttl : std::chrono::milliseconds(0));
  ++impl_->stats.sets;
}

bool CacheManager::Erase(const std::string& ns, const std::string& key) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto ns_it = impl_->spaces.find(ns);
  if (ns_it == impl_->spaces.end()) {
    return false;
  }
  const bool erased = ns_it->second.erase(key) > 0;
  if (ns_it->second.empty()) {
    impl_->spaces.erase(ns_it);
  }
  return erased;
}

size_t CacheManager::ClearNamespace(const std::string& ns) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto ns_it = impl_->spaces.find(ns);
  if (ns_it == impl_->spaces.end()) {
    return 0;
  }
  const size_t removed = ns_it->second.size();
  impl_->spaces.erase(ns_it);
  return removed;
}

size_t CacheManager::Purge() {
  const auto now = Impl::Clock::now();
  size_t removed = 0;
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (auto ns_it = impl_->spaces.begin(); ns_it != impl_->spaces.end();) {
    auto& entries = ns_it->second;
    for (auto it = entries.begin(); it != entries.end();) {
      if (now >= it->second.expires_at) {
        it = entries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (entries.empty()) {
      ns_it = impl_->spaces.erase(ns_it);
    } else {
      ++ns_it;
    }
  }
  return removed;
}

CacheStats CacheManager::GetStats() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  CacheStats snapshot = impl_->stats;
  snapshot.entries = 0;
  for (const auto& space : impl_->spaces) {
    snapshot.entries += space.second.size();
  }
  return snapshot;
}

#ifdef AVLINK_TESTING
namespace test {

std::optional<ParamValue> CacheGetAt(CacheManager& cache,
                                     const std::string& ns,
                                     const std::string& key,
                                     std::chrono::steady_clock::time_point now) {
  auto entry = cache.impl_->Lookup(ns, key, now);
  if (!entry.has_value()) {
    return std::nullopt;
  }
  return entry->value;
}

}  // namespace test
#endif

}  // namespace avlink
