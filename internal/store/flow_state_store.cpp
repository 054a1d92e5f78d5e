#include "internal/store/flow_state_store.hpp"

#include <algorithm>
#include <chrono>

#include "config/config.pb.h"
#include "flowstate/v1/flow_state.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowstate::store {

using flowstate::observability::IntField;
using flowstate::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExistsError(message);
    case db::ErrorCode::NotFound:
      throw util::NotFoundError(message);
    case db::ErrorCode::Conflict:
      throw util::ConcurrentModificationError(message, 0, 0);
    default:
      throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
  }
}

void Commit(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const util::FlowStateError&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::StorageError(context + ": commit failed: " + ex.what());
  }
}

std::string FlowLabel(const std::string& flow_id, const std::string& tenant_id) {
  return "flow " + flow_id + " (tenant " + tenant_id + ")";
}

flowstate::v1::CheckpointRing ParseRing(const db::model::FlowStateRecord& record) {
  flowstate::v1::CheckpointRing ring;
  if (!record.checkpoints_blob.empty() && !ring.ParseFromString(record.checkpoints_blob)) {
    FLOWSTATE_LOG_WARN("Discarding unreadable checkpoint ring", {StringField("flow_id", record.flow_id), StringField("tenant_id", record.tenant_id)});
    ring.Clear();
  }
  return ring;
}

class OperationTimer {
 public:
  explicit OperationTimer(std::string_view op) : op_(op), start_(std::chrono::steady_clock::now()) {
  }

  ~OperationTimer() {
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordOperation(op_, success_);
    metrics.ObserveOperationLatencyMs(op_, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count());
  }

  void Succeeded() {
    success_ = true;
  }

 private:
  std::string_view                      op_;
  std::chrono::steady_clock::time_point start_;
  bool                                  success_ = false;
};

} // namespace

StoreOptions StoreOptions::FromConfig(const flowstate::runtime::config::RuntimeConfig& config) {
  StoreOptions options;
  if (config.retention().checkpoint_limit() > 0) {
    options.checkpoint_limit = config.retention().checkpoint_limit();
  }
  if (config.retention().archive_limit() > 0) {
    options.archive_limit = config.retention().archive_limit();
  }
  return options;
}

FlowStateStore::FlowStateStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const codec::StateCodec> codec,
                               std::shared_ptr<cache::SecureCache> cache, StoreOptions options)
    : repository_(std::move(repository)), codec_(std::move(codec)), cache_(std::move(cache)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("FlowStateStore requires a repository");
  }
  if (!codec_) {
    throw std::invalid_argument("FlowStateStore requires a codec");
  }
  options_.checkpoint_limit = std::max<uint32_t>(options_.checkpoint_limit, 1);
  options_.archive_limit    = std::max<uint32_t>(options_.archive_limit, 1);
}

void FlowStateStore::CacheLive(const db::model::FlowStateRecord& record) {
  if (!cache_) {
    return;
  }
  flowstate::v1::CachedState cached;
  cached.set_version(record.version);
  cached.set_phase(record.phase);
  cached.set_status(record.status);
  cached.set_state_blob(record.state_blob);
  cached.set_updated_at_ms(record.updated_at_ms);
  cache_->Set(record.tenant_id, record.flow_id, cache::SecureCache::kLiveSlot, cached);
}

void FlowStateStore::CacheCheckpoint(const flowstate::v1::CheckpointEntry& entry, const std::string& status) {
  if (!cache_) {
    return;
  }
  flowstate::v1::CachedState cached;
  cached.set_version(entry.state_version());
  cached.set_phase(entry.phase());
  cached.set_status(status);
  cached.set_state_blob(entry.state_blob());
  cached.set_updated_at_ms(entry.created_at_ms());
  cache_->Set(entry.tenant_id(), entry.flow_id(), cache::SecureCache::CheckpointSlot(entry.checkpoint_id()), cached);
}

flowstate::v1::CheckpointEntry FlowStateStore::AppendCheckpoint(flowstate::v1::CheckpointRing* ring, const db::model::FlowStateRecord& record,
                                                                const std::string& checkpoint_id, const std::string& phase) const {
  auto entry = ring->add_entries();
  entry->set_checkpoint_id(checkpoint_id);
  entry->set_flow_id(record.flow_id);
  entry->set_tenant_id(record.tenant_id);
  entry->set_phase(phase.empty() ? record.phase : phase);
  entry->set_state_version(record.version);
  entry->set_state_blob(record.state_blob);
  entry->set_created_at_ms(util::NowMillis());
  auto created = *entry;

  const auto overflow = ring->entries_size() - static_cast<int>(options_.checkpoint_limit);
  if (overflow > 0) {
    ring->mutable_entries()->DeleteSubrange(0, overflow);
  }
  return created;
}

SaveResult FlowStateStore::Save(const std::string& flow_id, const std::string& tenant_id, const state::State& input, const std::string& phase,
                                std::optional<uint64_t> expected_version) {
  return SaveImpl(flow_id, tenant_id, input, phase, expected_version, nullptr);
}

SaveResult FlowStateStore::Save(const std::string& flow_id, const std::string& tenant_id, const state::State& input, const std::string& phase,
                                std::optional<uint64_t> expected_version, const PriorCheckpoint& checkpoint) {
  return SaveImpl(flow_id, tenant_id, input, phase, expected_version, &checkpoint);
}

SaveResult FlowStateStore::SaveImpl(const std::string& flow_id, const std::string& tenant_id, const state::State& input, const std::string& phase,
                                    std::optional<uint64_t> expected_version, const PriorCheckpoint* checkpoint) {
  OperationTimer            timer("save");
  observability::SpanScope span("flowstate.store.save");
  span.SetAttribute("flow_id", flow_id);
  span.SetAttribute("tenant_id", tenant_id);

  const auto now    = util::Now();
  const auto now_ms = util::ToUnixMillis(now);

  state::State doc = input;
  state::SetString(&doc, state::keys::kUpdatedAt, util::ToRfc3339(now));

  auto validation = state::StateValidator::Validate(doc);
  if (state::GetString(doc, state::keys::kFlowId) != flow_id || state::GetString(doc, state::keys::kTenantId) != tenant_id) {
    validation.valid = false;
    validation.errors.push_back("state identity does not match " + FlowLabel(flow_id, tenant_id));
  }
  state::StateValidator::ThrowIfInvalid(validation, "save " + FlowLabel(flow_id, tenant_id));

  db::model::FlowStateRecord record;
  record.flow_id       = flow_id;
  record.tenant_id     = tenant_id;
  record.phase         = phase.empty() ? state::GetString(doc, state::keys::kCurrentPhase) : phase;
  record.status        = state::GetString(doc, state::keys::kStatus);
  record.state_blob    = codec_->Encode(doc);
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;

  auto tx      = repository_->Begin();
  auto current = repository_->GetFlowStateForUpdate(*tx, flow_id, tenant_id);

  const uint64_t actual = current ? current->version : 0;
  const bool     stale  = expected_version.has_value() && (current ? *expected_version != actual : *expected_version != 0);

  db::Result write = db::Result::Ok();
  if (!stale) {
    if (current) {
      record.version = actual + 1;
      write          = repository_->UpdateFlowState(*tx, record, actual);
    } else {
      record.version = 1;
      write          = repository_->InsertFlowState(*tx, record);
    }
  }

  if (stale || write.code == db::ErrorCode::Conflict || write.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    if (cache_) {
      cache_->Invalidate(tenant_id, flow_id);
    }
    observability::Metrics::Instance().RecordVersionConflict();
    const uint64_t expected = expected_version.value_or(actual);
    FLOWSTATE_LOG_WARN("Rejected concurrent modification",
                       {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                        IntField("expected_version", static_cast<int64_t>(expected)), IntField("actual_version", static_cast<int64_t>(actual))});
    span.RecordException("concurrent modification");
    throw util::ConcurrentModificationError("concurrent modification of " + FlowLabel(flow_id, tenant_id) + ": expected version " +
                                                std::to_string(expected) + ", found " + std::to_string(actual),
                                            expected, actual);
  }
  ThrowIfDbError(write, "save " + FlowLabel(flow_id, tenant_id));

  db::model::FlowVersionRecord history;
  history.flow_id       = flow_id;
  history.tenant_id     = tenant_id;
  history.version       = record.version;
  history.phase         = record.phase;
  history.status        = record.status;
  history.state_blob    = record.state_blob;
  history.created_at_ms = now_ms;
  ThrowIfDbError(repository_->InsertFlowVersion(*tx, history), "record version history");

  std::optional<flowstate::v1::CheckpointEntry> prior;
  if (checkpoint && current) {
    auto ring = ParseRing(*current);
    prior     = AppendCheckpoint(&ring, *current, checkpoint->checkpoint_id, checkpoint->phase);
    ThrowIfDbError(repository_->UpdateCheckpoints(*tx, flow_id, tenant_id, ring.SerializeAsString()), "store checkpoint ring");
  }

  Commit(*tx, "save " + FlowLabel(flow_id, tenant_id));

  CacheLive(record);
  if (prior) {
    CacheCheckpoint(*prior, current->status);
    FLOWSTATE_LOG_INFO("Created checkpoint", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                              StringField("checkpoint_id", prior->checkpoint_id()), StringField("phase", prior->phase()),
                                              IntField("state_version", static_cast<int64_t>(prior->state_version()))});
  }

  span.SetAttribute("version", static_cast<int64_t>(record.version));
  FLOWSTATE_LOG_DEBUG("Saved flow state", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                           IntField("version", static_cast<int64_t>(record.version)), StringField("phase", record.phase)});
  timer.Succeeded();
  return SaveResult{record.version, now_ms, util::ToRfc3339(now)};
}

std::optional<VersionedState> FlowStateStore::Load(const std::string& flow_id, const std::string& tenant_id) {
  OperationTimer timer("load");

  if (cache_) {
    if (auto cached = cache_->Get(tenant_id, flow_id, cache::SecureCache::kLiveSlot)) {
      try {
        auto doc = codec_->Decode(cached->state_blob());
        if (state::GetString(doc, state::keys::kFlowId) == flow_id && state::GetString(doc, state::keys::kTenantId) == tenant_id) {
          VersionedState out{std::move(doc), cached->version(), cached->phase(), cached->status(), cached->updated_at_ms()};
          timer.Succeeded();
          return out;
        }
        FLOWSTATE_LOG_WARN("Cached state belongs to another flow, falling back to store",
                           {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                            StringField("cached_flow_id", state::GetString(doc, state::keys::kFlowId)),
                            StringField("cached_tenant_id", state::GetString(doc, state::keys::kTenantId))});
      } catch (const util::FlowStateError& ex) {
        FLOWSTATE_LOG_WARN("Cached state does not decode, falling back to store",
                           {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id), StringField("error", ex.what())});
      }
      cache_->Invalidate(tenant_id, flow_id);
    }
  }

  // The cache is filled before commit so that, on backends that serialize
  // transactions, a read can not land in the cache after a later commit.
  auto tx     = repository_->Begin();
  auto record = repository_->GetFlowState(*tx, flow_id, tenant_id);
  if (!record) {
    Commit(*tx, "load " + FlowLabel(flow_id, tenant_id));
    timer.Succeeded();
    return std::nullopt;
  }

  VersionedState out{codec_->Decode(record->state_blob), record->version, record->phase, record->status, record->updated_at_ms};
  CacheLive(*record);
  Commit(*tx, "load " + FlowLabel(flow_id, tenant_id));
  timer.Succeeded();
  return out;
}

std::optional<db::model::FlowStateRecord> FlowStateStore::LoadRaw(const std::string& flow_id, const std::string& tenant_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetFlowState(*tx, flow_id, tenant_id);
  Commit(*tx, "load " + FlowLabel(flow_id, tenant_id));
  return record;
}

std::string FlowStateStore::CreateCheckpoint(const std::string& flow_id, const std::string& tenant_id, const std::string& phase) {
  OperationTimer            timer("checkpoint");
  observability::SpanScope span("flowstate.store.checkpoint");
  span.SetAttribute("flow_id", flow_id);

  auto tx     = repository_->Begin();
  auto record = repository_->GetFlowStateForUpdate(*tx, flow_id, tenant_id);
  if (!record) {
    throw util::NotFoundError("cannot checkpoint missing " + FlowLabel(flow_id, tenant_id));
  }

  auto       ring    = ParseRing(*record);
  const auto created = AppendCheckpoint(&ring, *record, util::NewId(), phase);
  ThrowIfDbError(repository_->UpdateCheckpoints(*tx, flow_id, tenant_id, ring.SerializeAsString()), "store checkpoint ring");
  Commit(*tx, "checkpoint " + FlowLabel(flow_id, tenant_id));

  CacheCheckpoint(created, record->status);

  FLOWSTATE_LOG_INFO("Created checkpoint", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                            StringField("checkpoint_id", created.checkpoint_id()), StringField("phase", created.phase()),
                                            IntField("state_version", static_cast<int64_t>(created.state_version()))});
  timer.Succeeded();
  return created.checkpoint_id();
}

std::vector<CheckpointInfo> FlowStateStore::ListCheckpoints(const std::string& flow_id, const std::string& tenant_id) {
  auto record = LoadRaw(flow_id, tenant_id);
  if (!record) {
    return {};
  }

  std::vector<CheckpointInfo> out;
  for (const auto& entry : ParseRing(*record).entries()) {
    CheckpointInfo info;
    info.checkpoint_id = entry.checkpoint_id();
    info.flow_id       = entry.flow_id();
    info.tenant_id     = entry.tenant_id();
    info.phase         = entry.phase();
    info.state_version = entry.state_version();
    info.created_at_ms = entry.created_at_ms();
    try {
      info.snapshot = codec_->Decode(entry.state_blob());
    } catch (const util::FlowStateError& ex) {
      FLOWSTATE_LOG_WARN("Checkpoint snapshot does not decode",
                         {StringField("flow_id", flow_id), StringField("checkpoint_id", entry.checkpoint_id()), StringField("error", ex.what())});
      info.decodable = false;
    }
    out.push_back(std::move(info));
  }
  return out;
}

std::vector<VersionInfo> FlowStateStore::GetVersions(const std::string& flow_id, const std::string& tenant_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListFlowVersions(*tx, flow_id, tenant_id);
  Commit(*tx, "list versions of " + FlowLabel(flow_id, tenant_id));

  std::vector<VersionInfo> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(VersionInfo{row.version, row.phase, row.status, row.created_at_ms});
  }
  return out;
}

std::size_t FlowStateStore::CleanupOldVersions(const std::string& flow_id, const std::string& tenant_id, uint32_t keep) {
  keep = std::max<uint32_t>(keep, 1);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListFlowVersions(*tx, flow_id, tenant_id);
  if (rows.size() <= keep) {
    Commit(*tx, "cleanup versions of " + FlowLabel(flow_id, tenant_id));
    return 0;
  }

  const auto removed     = rows.size() - keep;
  const auto min_version = rows[removed].version;
  ThrowIfDbError(repository_->DeleteFlowVersionsBelow(*tx, flow_id, tenant_id, min_version), "prune version history");
  Commit(*tx, "cleanup versions of " + FlowLabel(flow_id, tenant_id));

  FLOWSTATE_LOG_INFO("Pruned version history", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                IntField("removed", static_cast<int64_t>(removed)), IntField("kept", keep)});
  return removed;
}

std::string FlowStateStore::ArchiveSnapshot(const std::string& flow_id, const std::string& tenant_id, const std::string& blob, uint64_t version,
                                            const std::string& reason) {
  db::model::ArchivedStateRecord archive;
  archive.archive_id     = util::NewId();
  archive.flow_id        = flow_id;
  archive.tenant_id      = tenant_id;
  archive.version        = version;
  archive.reason         = reason;
  archive.state_blob     = blob;
  archive.archived_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertArchivedState(*tx, archive), "archive snapshot of " + FlowLabel(flow_id, tenant_id));
  ThrowIfDbError(repository_->TrimArchivedStates(*tx, flow_id, tenant_id, options_.archive_limit), "trim archived snapshots");
  Commit(*tx, "archive snapshot of " + FlowLabel(flow_id, tenant_id));

  FLOWSTATE_LOG_WARN("Archived flow state snapshot", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                      StringField("archive_id", archive.archive_id), StringField("reason", reason)});
  return archive.archive_id;
}

std::vector<ArchiveInfo> FlowStateStore::ListArchivedSnapshots(const std::string& flow_id, const std::string& tenant_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListArchivedStates(*tx, flow_id, tenant_id);
  Commit(*tx, "list archives of " + FlowLabel(flow_id, tenant_id));

  std::vector<ArchiveInfo> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(ArchiveInfo{row.archive_id, row.version, row.reason, row.state_blob.size(), row.archived_at_ms});
  }
  return out;
}

void FlowStateStore::Delete(const std::string& flow_id, const std::string& tenant_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetFlowStateForUpdate(*tx, flow_id, tenant_id)) {
    throw util::NotFoundError(FlowLabel(flow_id, tenant_id) + " not found");
  }
  ThrowIfDbError(repository_->DeleteFlowState(*tx, flow_id, tenant_id), "delete " + FlowLabel(flow_id, tenant_id));
  Commit(*tx, "delete " + FlowLabel(flow_id, tenant_id));

  if (cache_) {
    cache_->Invalidate(tenant_id, flow_id);
  }
  FLOWSTATE_LOG_INFO("Deleted flow state", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id)});
}

std::vector<FlowSummary> FlowStateStore::ListFlows(const std::string& tenant_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListFlowStates(*tx, tenant_id);
  Commit(*tx, "list flows of tenant " + tenant_id);

  std::vector<FlowSummary> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(FlowSummary{row.flow_id, row.version, row.phase, row.status, row.updated_at_ms});
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.flow_id < b.flow_id; });
  return out;
}

} // namespace flowstate::store
