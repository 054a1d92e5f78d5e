#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace flowstate::db::sqlite {

using flowstate::db::ErrorCode;
using flowstate::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Statement(nullptr, &sqlite3_finalize);
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  // s.data() is never null, so empty strings bind as zero-length BLOBs
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::FlowStateRecord ReadFlowState(sqlite3_stmt* st) {
  model::FlowStateRecord r;
  r.flow_id          = ColText(st, 0);
  r.tenant_id        = ColText(st, 1);
  r.version          = ColU64(st, 2);
  r.phase            = ColText(st, 3);
  r.status           = ColText(st, 4);
  r.state_blob       = ColBlob(st, 5);
  r.checkpoints_blob = ColBlob(st, 6);
  r.created_at_ms    = ColU64(st, 7);
  r.updated_at_ms    = ColU64(st, 8);
  return r;
}

model::FlowVersionRecord ReadFlowVersion(sqlite3_stmt* st) {
  model::FlowVersionRecord r;
  r.flow_id       = ColText(st, 0);
  r.tenant_id     = ColText(st, 1);
  r.version       = ColU64(st, 2);
  r.phase         = ColText(st, 3);
  r.status        = ColText(st, 4);
  r.state_blob    = ColBlob(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::ArchivedStateRecord ReadArchivedState(sqlite3_stmt* st) {
  model::ArchivedStateRecord r;
  r.archive_id     = ColText(st, 0);
  r.flow_id        = ColText(st, 1);
  r.tenant_id      = ColText(st, 2);
  r.version        = ColU64(st, 3);
  r.reason         = ColText(st, 4);
  r.state_blob     = ColBlob(st, 5);
  r.archived_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Flow state
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlowState(Transaction& t, const model::FlowStateRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_FLOW_STATE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.flow_id);
    BindText(st.get(), 2, r.tenant_id);
    BindU64(st.get(), 3, r.version);
    BindText(st.get(), 4, r.phase);
    BindText(st.get(), 5, r.status);
    BindBlob(st.get(), 6, r.state_blob);
    BindBlob(st.get(), 7, r.checkpoints_blob);
    BindU64(st.get(), 8, r.created_at_ms);
    BindU64(st.get(), 9, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::FlowStateRecord>
SqliteRepository::GetFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SELECT_FLOW_STATE);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, tenant_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadFlowState(st.get());
}

// BEGIN IMMEDIATE already holds the write lock for the whole transaction.
std::optional<model::FlowStateRecord>
SqliteRepository::GetFlowStateForUpdate(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
    return GetFlowState(t, flow_id, tenant_id);
}

Result SqliteRepository::UpdateFlowState(Transaction& t, const model::FlowStateRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPDATE_FLOW_STATE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.version);
    BindText(st.get(), 2, r.phase);
    BindText(st.get(), 3, r.status);
    BindBlob(st.get(), 4, r.state_blob);
    BindU64(st.get(), 5, r.updated_at_ms);
    BindText(st.get(), 6, r.flow_id);
    BindText(st.get(), 7, r.tenant_id);
    BindU64(st.get(), 8, expected_version);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 1) return Result::Ok();

    // distinguish a stale version from a missing row
    auto stored = Prepare(db, sql::SELECT_FLOW_STATE_VERSION);
    if (!stored) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(stored.get(), 1, r.flow_id);
    BindText(stored.get(), 2, r.tenant_id);
    if (sqlite3_step(stored.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "flow state not found");
    return Result::Err(ErrorCode::Conflict, "stored version " + std::to_string(ColU64(stored.get(), 0)) + " != expected " +
                                                std::to_string(expected_version));
}

Result SqliteRepository::UpdateCheckpoints(Transaction& t, const std::string& flow_id, const std::string& tenant_id,
                                           const std::string& checkpoints_blob) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPDATE_FLOW_CHECKPOINTS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st.get(), 1, checkpoints_blob);
    BindText(st.get(), 2, flow_id);
    BindText(st.get(), 3, tenant_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "flow state not found");
    return Result::Ok();
}

Result SqliteRepository::DeleteFlowState(Transaction& t, const std::string& flow_id, const std::string& tenant_id) {
    auto* db = TX(t).Handle();

    for (const char* sql : {sql::DELETE_FLOW_VERSIONS, sql::DELETE_ARCHIVED_STATES, sql::DELETE_FLOW_STATE}) {
        auto st = Prepare(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(st.get(), 1, flow_id);
        BindText(st.get(), 2, tenant_id);
        auto result = Translate(db, sqlite3_step(st.get()));
        if (!result) return result;
    }
    return Result::Ok();
}

std::vector<model::FlowStateRecord> SqliteRepository::ListFlowStates(Transaction& t, const std::string& tenant_id) {
    auto* db = TX(t).Handle();
    std::vector<model::FlowStateRecord> out;

    auto st = Prepare(db, sql::SELECT_FLOW_STATES_BY_TENANT);
    if (!st) return out;

    BindText(st.get(), 1, tenant_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadFlowState(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Version history
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlowVersion(Transaction& t, const model::FlowVersionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_FLOW_VERSION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.flow_id);
    BindText(st.get(), 2, r.tenant_id);
    BindU64(st.get(), 3, r.version);
    BindText(st.get(), 4, r.phase);
    BindText(st.get(), 5, r.status);
    BindBlob(st.get(), 6, r.state_blob);
    BindU64(st.get(), 7, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FlowVersionRecord> SqliteRepository::ListFlowVersions(Transaction& t, const std::string& flow_id,
                                                                         const std::string& tenant_id) {
    auto* db = TX(t).Handle();
    std::vector<model::FlowVersionRecord> out;

    auto st = Prepare(db, sql::SELECT_FLOW_VERSIONS);
    if (!st) return out;

    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, tenant_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadFlowVersion(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteFlowVersionsBelow(Transaction& t, const std::string& flow_id, const std::string& tenant_id,
                                                 uint64_t min_version) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_FLOW_VERSIONS_BELOW);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, tenant_id);
    BindU64(st.get(), 3, min_version);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Archived snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertArchivedState(Transaction& t, const model::ArchivedStateRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_ARCHIVED_STATE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.archive_id);
    BindText(st.get(), 2, r.flow_id);
    BindText(st.get(), 3, r.tenant_id);
    BindU64(st.get(), 4, r.version);
    BindText(st.get(), 5, r.reason);
    BindBlob(st.get(), 6, r.state_blob);
    BindU64(st.get(), 7, r.archived_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ArchivedStateRecord> SqliteRepository::ListArchivedStates(Transaction& t, const std::string& flow_id,
                                                                             const std::string& tenant_id) {
    auto* db = TX(t).Handle();
    std::vector<model::ArchivedStateRecord> out;

    auto st = Prepare(db, sql::SELECT_ARCHIVED_STATES);
    if (!st) return out;

    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, tenant_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadArchivedState(st.get()));
    }
    return out;
}

Result SqliteRepository::TrimArchivedStates(Transaction& t, const std::string& flow_id, const std::string& tenant_id,
                                            uint64_t max_entries) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::TRIM_ARCHIVED_STATES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, tenant_id);
    BindText(st.get(), 3, flow_id);
    BindText(st.get(), 4, tenant_id);
    BindU64(st.get(), 5, max_entries);

    return Translate(db, sqlite3_step(st.get()));
}

} // namespace flowstate::db::sqlite
