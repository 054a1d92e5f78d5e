#include "pg_repository.hpp"

#include <cstddef>

namespace flowstate::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

Bytes ToBytes(const std::string& s) {
  return Bytes(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

std::string FromBytes(const pqxx::field& f) {
  if (f.is_null()) return {};
  const auto bytes = f.as<Bytes>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

model::FlowStateRecord ReadFlowState(const pqxx::row& row) {
  model::FlowStateRecord r;
  r.flow_id          = row[0].c_str();
  r.tenant_id        = row[1].c_str();
  r.version          = row[2].as<uint64_t>();
  r.phase            = row[3].c_str();
  r.status           = row[4].c_str();
  r.state_blob       = FromBytes(row[5]);
  r.checkpoints_blob = FromBytes(row[6]);
  r.created_at_ms    = row[7].as<uint64_t>();
  r.updated_at_ms    = row[8].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Flow state
// ------------------------------------------------------------------

Result PgRepository::InsertFlowState(Transaction& t, const model::FlowStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_flow_state", r.flow_id, r.tenant_id, r.version, r.phase, r.status, ToBytes(r.state_blob),
                               ToBytes(r.checkpoints_blob), r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FlowStateRecord> PgRepository::GetFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("get_flow_state", flow_id, tenant_id);
  if (res.empty()) return std::nullopt;
  return ReadFlowState(res[0]);
}

std::optional<model::FlowStateRecord> PgRepository::GetFlowStateForUpdate(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("get_flow_state_for_update", flow_id, tenant_id);
  if (res.empty()) return std::nullopt;
  return ReadFlowState(res[0]);
}

Result PgRepository::UpdateFlowState(Transaction& t, const model::FlowStateRecord& r, uint64_t expected_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_flow_state", r.version, r.phase, r.status, ToBytes(r.state_blob), r.updated_at_ms, r.flow_id,
                                    r.tenant_id, expected_version);
    if (res.affected_rows() == 1) return Result::Ok();

    auto stored = work.exec_prepared("get_flow_state_version", r.flow_id, r.tenant_id);
    if (stored.empty()) return Result::Err(ErrorCode::NotFound, "flow state not found");
    return Result::Err(ErrorCode::Conflict,
                       "stored version " + std::to_string(stored[0][0].as<uint64_t>()) + " != expected " + std::to_string(expected_version));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateCheckpoints(Transaction& t, const std::string& flow_id, const std::string& tenant_id, const std::string& checkpoints_blob) {
  try {
    auto res = TX(t).Work().exec_prepared("update_flow_checkpoints", ToBytes(checkpoints_blob), flow_id, tenant_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "flow state not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("delete_flow_versions", flow_id, tenant_id);
    work.exec_prepared("delete_archived_states", flow_id, tenant_id);
    work.exec_prepared("delete_flow_state", flow_id, tenant_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FlowStateRecord> PgRepository::ListFlowStates(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("list_flow_states", tenant_id);

  std::vector<model::FlowStateRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadFlowState(row));
  }
  return records;
}

// ------------------------------------------------------------------
// Version history
// ------------------------------------------------------------------

Result PgRepository::InsertFlowVersion(Transaction& t, const model::FlowVersionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_flow_version", r.flow_id, r.tenant_id, r.version, r.phase, r.status, ToBytes(r.state_blob), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FlowVersionRecord> PgRepository::ListFlowVersions(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("list_flow_versions", flow_id, tenant_id);

  std::vector<model::FlowVersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FlowVersionRecord r;
    r.flow_id       = row[0].c_str();
    r.tenant_id     = row[1].c_str();
    r.version       = row[2].as<uint64_t>();
    r.phase         = row[3].c_str();
    r.status        = row[4].c_str();
    r.state_blob    = FromBytes(row[5]);
    r.created_at_ms = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteFlowVersionsBelow(Transaction& t, const std::string& flow_id, const std::string& tenant_id, uint64_t min_version) {
  try {
    TX(t).Work().exec_prepared("delete_flow_versions_below", flow_id, tenant_id, min_version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Archived snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertArchivedState(Transaction& t, const model::ArchivedStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_archived_state", r.archive_id, r.flow_id, r.tenant_id, r.version, r.reason, ToBytes(r.state_blob),
                               r.archived_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ArchivedStateRecord> PgRepository::ListArchivedStates(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_prepared("list_archived_states", flow_id, tenant_id);

  std::vector<model::ArchivedStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ArchivedStateRecord r;
    r.archive_id     = row[0].c_str();
    r.flow_id        = row[1].c_str();
    r.tenant_id      = row[2].c_str();
    r.version        = row[3].as<uint64_t>();
    r.reason         = row[4].c_str();
    r.state_blob     = FromBytes(row[5]);
    r.archived_at_ms = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::TrimArchivedStates(Transaction& t, const std::string& flow_id, const std::string& tenant_id, uint64_t max_entries) {
  try {
    TX(t).Work().exec_prepared("trim_archived_states", flow_id, tenant_id, max_entries);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace flowstate::db::postgres
