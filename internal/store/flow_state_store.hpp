#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/secure_cache.hpp"
#include "internal/codec/state_codec.hpp"
#include "flowstate/v1/flow_state.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/state/flow_state.hpp"

namespace flowstate::runtime::config {
class RuntimeConfig;
}

namespace flowstate::store {

struct SaveResult {
  uint64_t    version       = 0;
  uint64_t    updated_at_ms = 0;
  std::string timestamp;
};

struct VersionedState {
  state::State state;
  uint64_t     version = 0;
  std::string  phase;
  std::string  status;
  uint64_t     updated_at_ms = 0;
};

struct CheckpointInfo {
  std::string  checkpoint_id;
  std::string  flow_id;
  std::string  tenant_id;
  std::string  phase;
  uint64_t     state_version = 0;
  uint64_t     created_at_ms = 0;
  state::State snapshot;
  // false when the snapshot no longer decodes; snapshot is then empty
  bool decodable = true;
};

struct VersionInfo {
  uint64_t    version = 0;
  std::string phase;
  std::string status;
  uint64_t    created_at_ms = 0;
};

struct ArchiveInfo {
  std::string archive_id;
  uint64_t    version = 0;
  std::string reason;
  uint64_t    size_bytes     = 0;
  uint64_t    archived_at_ms = 0;
};

struct FlowSummary {
  std::string flow_id;
  uint64_t    version = 0;
  std::string phase;
  std::string status;
  uint64_t    updated_at_ms = 0;
};

// Checkpoint of the record as it stood before a Save, committed in the
// same transaction as the write.
struct PriorCheckpoint {
  std::string checkpoint_id;
  // empty = phase of the prior record
  std::string phase;
};

struct StoreOptions {
  uint32_t checkpoint_limit = 10;
  uint32_t archive_limit    = 5;

  static StoreOptions FromConfig(const flowstate::runtime::config::RuntimeConfig& config);
};

/*
  Single source of truth for flow state.

  One record per (flow_id, tenant_id) with an optimistic version counter,
  an embedded checkpoint ring, version history and archived snapshots.

  Write path: validate -> encode -> (tx) read for update, compare version,
  write, append history, optionally checkpoint the prior record, commit ->
  write through cache.
  Read path: cache (identity checked) -> repository -> decode, repopulating
  the cache before the read transaction ends.

  The cache is advisory; a cache failure never fails an operation.
  The store never merges conflicting writes.
*/
class FlowStateStore {
 public:
  FlowStateStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const codec::StateCodec> codec,
                 std::shared_ptr<cache::SecureCache> cache, StoreOptions options);

  // expected_version: nullopt = unconditional, 0 = create only,
  // N = the stored version must be N.
  SaveResult Save(const std::string& flow_id, const std::string& tenant_id, const state::State& state, const std::string& phase,
                  std::optional<uint64_t> expected_version = std::nullopt);

  // Save that also snapshots the prior record into the checkpoint ring.
  // A rejected write leaves the ring untouched.
  SaveResult Save(const std::string& flow_id, const std::string& tenant_id, const state::State& state, const std::string& phase,
                  std::optional<uint64_t> expected_version, const PriorCheckpoint& checkpoint);

  std::optional<VersionedState> Load(const std::string& flow_id, const std::string& tenant_id);

  // Record without decoding the blob.
  std::optional<db::model::FlowStateRecord> LoadRaw(const std::string& flow_id, const std::string& tenant_id);

  std::string                 CreateCheckpoint(const std::string& flow_id, const std::string& tenant_id, const std::string& phase);
  std::vector<CheckpointInfo> ListCheckpoints(const std::string& flow_id, const std::string& tenant_id);

  std::vector<VersionInfo> GetVersions(const std::string& flow_id, const std::string& tenant_id);
  std::size_t              CleanupOldVersions(const std::string& flow_id, const std::string& tenant_id, uint32_t keep);

  std::string              ArchiveSnapshot(const std::string& flow_id, const std::string& tenant_id, const std::string& blob, uint64_t version,
                                           const std::string& reason);
  std::vector<ArchiveInfo> ListArchivedSnapshots(const std::string& flow_id, const std::string& tenant_id);

  void Delete(const std::string& flow_id, const std::string& tenant_id);

  std::vector<FlowSummary> ListFlows(const std::string& tenant_id);

  const codec::StateCodec& Codec() const {
    return *codec_;
  }

  const StoreOptions& Options() const {
    return options_;
  }

 private:
  SaveResult SaveImpl(const std::string& flow_id, const std::string& tenant_id, const state::State& state, const std::string& phase,
                      std::optional<uint64_t> expected_version, const PriorCheckpoint* checkpoint);

  // Appends a snapshot of record to its ring and trims it to checkpoint_limit.
  flowstate::v1::CheckpointEntry AppendCheckpoint(flowstate::v1::CheckpointRing* ring, const db::model::FlowStateRecord& record,
                                                  const std::string& checkpoint_id, const std::string& phase) const;

  void CacheLive(const db::model::FlowStateRecord& record);
  void CacheCheckpoint(const flowstate::v1::CheckpointEntry& entry, const std::string& status);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<const codec::StateCodec> codec_;
  std::shared_ptr<cache::SecureCache>      cache_;
  StoreOptions                             options_;
};

} // namespace flowstate::store
