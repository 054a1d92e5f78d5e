#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace flowstate::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Flow state
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlowState(Transaction& t, const model::FlowStateRecord& r) {
  auto&         s = TX(t).Mutable();
  const FlowKey key{r.tenant_id, r.flow_id};
  if (s.flows.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "flow state already exists");
  s.flows[key] = r;
  return Result::Ok();
}

std::optional<model::FlowStateRecord> MemoryRepository::GetFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.flows.find({tenant_id, flow_id});
  if (it == s.flows.end()) return std::nullopt;
  return it->second;
}

// Transactions hold writer_mutex_ from Begin(), so the plain read is already exclusive.
std::optional<model::FlowStateRecord> MemoryRepository::GetFlowStateForUpdate(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  return GetFlowState(t, flow_id, tenant_id);
}

Result MemoryRepository::UpdateFlowState(Transaction& t, const model::FlowStateRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.flows.find({r.tenant_id, r.flow_id});
  if (it == s.flows.end()) return Result::Err(ErrorCode::NotFound, "flow state not found");
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "stored version " + std::to_string(it->second.version) + " != expected " + std::to_string(expected_version));
  }

  auto checkpoints = std::move(it->second.checkpoints_blob);
  auto created_at  = it->second.created_at_ms;
  it->second       = r;
  // the ring and creation time are owned by their own write paths
  it->second.checkpoints_blob = std::move(checkpoints);
  it->second.created_at_ms    = created_at;
  return Result::Ok();
}

Result MemoryRepository::UpdateCheckpoints(Transaction& t, const std::string& flow_id, const std::string& tenant_id, const std::string& checkpoints_blob) {
  auto& s  = TX(t).Mutable();
  auto  it = s.flows.find({tenant_id, flow_id});
  if (it == s.flows.end()) return Result::Err(ErrorCode::NotFound, "flow state not found");
  it->second.checkpoints_blob = checkpoints_blob;
  return Result::Ok();
}

Result MemoryRepository::DeleteFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  auto&         s = TX(t).Mutable();
  const FlowKey key{tenant_id, flow_id};
  s.flows.erase(key);
  s.versions.erase(key);
  s.archives.erase(key);
  return Result::Ok();
}

std::vector<model::FlowStateRecord> MemoryRepository::ListFlowStates(Transaction& t, const std::string& tenant_id) {
  std::vector<model::FlowStateRecord> out;
  for (const auto& [key, record] : TX(t).View().flows) {
    if (key.first == tenant_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Version history
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlowVersion(Transaction& t, const model::FlowVersionRecord& r) {
  auto& history = TX(t).Mutable().versions[{r.tenant_id, r.flow_id}];
  for (const auto& existing : history) {
    if (existing.version == r.version) return Result::Err(ErrorCode::AlreadyExists, "version already recorded");
  }
  history.push_back(r);
  std::sort(history.begin(), history.end(), [](const auto& a, const auto& b) { return a.version < b.version; });
  return Result::Ok();
}

std::vector<model::FlowVersionRecord> MemoryRepository::ListFlowVersions(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.versions.find({tenant_id, flow_id});
  if (it == s.versions.end()) return {};
  return it->second;
}

Result MemoryRepository::DeleteFlowVersionsBelow(Transaction& t, const std::string& flow_id, const std::string& tenant_id, uint64_t min_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.versions.find({tenant_id, flow_id});
  if (it == s.versions.end()) return Result::Ok();
  std::erase_if(it->second, [min_version](const auto& v) { return v.version < min_version; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Archived snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertArchivedState(Transaction& t, const model::ArchivedStateRecord& r) {
  TX(t).Mutable().archives[{r.tenant_id, r.flow_id}].push_back(r);
  return Result::Ok();
}

std::vector<model::ArchivedStateRecord> MemoryRepository::ListArchivedStates(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.archives.find({tenant_id, flow_id});
  if (it == s.archives.end()) return {};
  return it->second;
}

Result MemoryRepository::TrimArchivedStates(Transaction& t, const std::string& flow_id, const std::string& tenant_id, uint64_t max_entries) {
  auto& s  = TX(t).Mutable();
  auto  it = s.archives.find({tenant_id, flow_id});
  if (it == s.archives.end()) return Result::Ok();

  auto& entries = it->second;
  if (entries.size() > max_entries) {
    entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - max_entries));
  }
  return Result::Ok();
}

} // namespace flowstate::db::memory
