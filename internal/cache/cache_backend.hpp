#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flowstate::cache {

/*
  Key/value store with per-entry TTL behind the secure cache.

  Implementations may throw on transport failure; SecureCache treats
  every failure as a miss.
*/
class CacheBackend {
 public:
  virtual ~CacheBackend() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual void Set(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

  virtual void Delete(const std::string& key) = 0;

  // Removes every key starting with prefix; returns how many were removed.
  virtual std::size_t DeletePrefix(const std::string& prefix) = 0;

  virtual void Clear() = 0;

  virtual std::size_t Size() const = 0;
};

} // namespace flowstate::cache
