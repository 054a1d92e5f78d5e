#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "flowstate/v1/flow_state.pb.h"
#include "internal/cache/cache_backend.hpp"
#include "internal/codec/state_encryption.hpp"

namespace flowstate::runtime::config {
class RuntimeConfig;
}

namespace flowstate::cache {

struct CacheOptions {
  bool                 enabled = true;
  std::chrono::seconds live_ttl{3600};
  std::chrono::seconds checkpoint_ttl{86400};

  static CacheOptions FromConfig(const flowstate::runtime::config::RuntimeConfig& config);
};

struct CacheStats {
  std::uint64_t hits   = 0;
  std::uint64_t misses = 0;
  std::uint64_t errors = 0;
};

/*
  Encrypted read-through cache in front of the store.

  Keys:   flowstate:<len>:<tenant_id>:<len>:<flow_id>:<slot>
  Slots:  "live" for current state, "checkpoint.<id>" for checkpoints.

  Tenant and flow ids are length-prefixed so ids containing ':' can not
  alias another tenant's entries. The phase is not part of the key; it is
  carried in CachedState.phase.

  Set never replaces an entry with a lower version, so a writer that
  lost a race can not roll the cached state back.

  Every value is sealed with the state key before it reaches the backend,
  regardless of field-level encryption. The cache never raises: backend
  or crypto failures are logged at warn and reported as misses.
*/
class SecureCache {
 public:
  static constexpr std::string_view kLiveSlot = "live";

  SecureCache(std::shared_ptr<CacheBackend> backend, std::shared_ptr<const codec::StateEncryption> encryption, CacheOptions options);

  static std::string Key(std::string_view tenant_id, std::string_view flow_id, std::string_view slot);
  static std::string CheckpointSlot(std::string_view checkpoint_id);

  bool Enabled() const;

  std::optional<flowstate::v1::CachedState> Get(const std::string& tenant_id, const std::string& flow_id, std::string_view slot);

  // Returns false when the write was skipped because a newer version is cached.
  bool Set(const std::string& tenant_id, const std::string& flow_id, std::string_view slot, const flowstate::v1::CachedState& value);

  // Drops every slot of the flow.
  void Invalidate(const std::string& tenant_id, const std::string& flow_id);

  void Clear();

  std::chrono::seconds TtlFor(std::string_view slot) const;

  CacheStats Stats() const;

 private:
  void RecordError(std::string_view op, const std::string& key, const std::exception& ex);

  std::shared_ptr<CacheBackend>                  backend_;
  std::shared_ptr<const codec::StateEncryption> encryption_;
  CacheOptions                                   options_;

  // Serializes read-compare-write in Set against Invalidate.
  std::mutex write_mutex_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> errors_{0};
};

} // namespace flowstate::cache
