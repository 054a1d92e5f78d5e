#pragma once

#include <chrono>
#include <map>
#include <shared_mutex>

#include "internal/cache/cache_backend.hpp"

namespace flowstate::cache {

// In-process TTL map. Expired entries are dropped on read and by a sweep
// whenever an insert would exceed max_entries; if the map is still full
// the entry closest to expiry is evicted.
class MemoryCacheBackend final : public CacheBackend {
 public:
  explicit MemoryCacheBackend(std::size_t max_entries = 10000);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Set(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  void                       Delete(const std::string& key) override;
  std::size_t                DeletePrefix(const std::string& prefix) override;
  void                       Clear() override;
  std::size_t                Size() const override;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    std::string            value;
    SteadyClock::time_point expires_at;
  };

  void SweepExpiredLocked(SteadyClock::time_point now);

  std::size_t max_entries_;

  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace flowstate::cache
