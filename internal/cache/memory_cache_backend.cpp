#include "internal/cache/memory_cache_backend.hpp"

#include <algorithm>
#include <mutex>

namespace flowstate::cache {

MemoryCacheBackend::MemoryCacheBackend(std::size_t max_entries) : max_entries_(std::max<std::size_t>(max_entries, 1)) {
}

std::optional<std::string> MemoryCacheBackend::Get(const std::string& key) {
  const auto now = SteadyClock::now();
  {
    std::shared_lock lock(mutex_);
    const auto       it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (it->second.expires_at > now) {
      return it->second.value;
    }
  }

  std::unique_lock lock(mutex_);
  const auto       it = entries_.find(key);
  if (it != entries_.end() && it->second.expires_at <= now) {
    entries_.erase(it);
  }
  return std::nullopt;
}

void MemoryCacheBackend::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  const auto       now = SteadyClock::now();
  std::unique_lock lock(mutex_);

  if (entries_.find(key) == entries_.end() && entries_.size() >= max_entries_) {
    SweepExpiredLocked(now);
    if (entries_.size() >= max_entries_) {
      const auto victim = std::min_element(entries_.begin(), entries_.end(),
                                           [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
      entries_.erase(victim);
    }
  }

  entries_[key] = Entry{std::move(value), now + ttl};
}

void MemoryCacheBackend::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  entries_.erase(key);
}

std::size_t MemoryCacheBackend::DeletePrefix(const std::string& prefix) {
  std::unique_lock lock(mutex_);
  std::size_t      removed = 0;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0;) {
    it = entries_.erase(it);
    ++removed;
  }
  return removed;
}

void MemoryCacheBackend::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

std::size_t MemoryCacheBackend::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void MemoryCacheBackend::SweepExpiredLocked(SteadyClock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace flowstate::cache
