#pragma once

namespace flowstate::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  IMPORTANT:
  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements; keep the column order identical.
*/

// flow state

static constexpr const char* INSERT_FLOW_STATE =
    "INSERT INTO flow_state(flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_FLOW_STATE =
    "SELECT flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms"
    " FROM flow_state WHERE flow_id=? AND tenant_id=?;";

static constexpr const char* SELECT_FLOW_STATES_BY_TENANT =
    "SELECT flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms"
    " FROM flow_state WHERE tenant_id=? ORDER BY flow_id;";

// compare-and-set on version
static constexpr const char* UPDATE_FLOW_STATE =
    "UPDATE flow_state SET version=?,phase=?,status=?,state_blob=?,updated_at_ms=?"
    " WHERE flow_id=? AND tenant_id=? AND version=?;";

static constexpr const char* SELECT_FLOW_STATE_VERSION =
    "SELECT version FROM flow_state WHERE flow_id=? AND tenant_id=?;";

static constexpr const char* UPDATE_FLOW_CHECKPOINTS =
    "UPDATE flow_state SET checkpoints_blob=? WHERE flow_id=? AND tenant_id=?;";

static constexpr const char* DELETE_FLOW_STATE =
    "DELETE FROM flow_state WHERE flow_id=? AND tenant_id=?;";

// version history

static constexpr const char* INSERT_FLOW_VERSION =
    "INSERT INTO flow_state_versions(flow_id,tenant_id,version,phase,status,state_blob,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_FLOW_VERSIONS =
    "SELECT flow_id,tenant_id,version,phase,status,state_blob,created_at_ms"
    " FROM flow_state_versions WHERE flow_id=? AND tenant_id=? ORDER BY version ASC;";

static constexpr const char* DELETE_FLOW_VERSIONS_BELOW =
    "DELETE FROM flow_state_versions WHERE flow_id=? AND tenant_id=? AND version<?;";

static constexpr const char* DELETE_FLOW_VERSIONS =
    "DELETE FROM flow_state_versions WHERE flow_id=? AND tenant_id=?;";

// archived snapshots

static constexpr const char* INSERT_ARCHIVED_STATE =
    "INSERT INTO flow_state_archive(archive_id,flow_id,tenant_id,version,reason,state_blob,archived_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ARCHIVED_STATES =
    "SELECT archive_id,flow_id,tenant_id,version,reason,state_blob,archived_at_ms"
    " FROM flow_state_archive WHERE flow_id=? AND tenant_id=? ORDER BY seq ASC;";

static constexpr const char* TRIM_ARCHIVED_STATES =
    "DELETE FROM flow_state_archive WHERE flow_id=? AND tenant_id=? AND seq NOT IN"
    " (SELECT seq FROM flow_state_archive WHERE flow_id=? AND tenant_id=? ORDER BY seq DESC LIMIT ?);";

static constexpr const char* DELETE_ARCHIVED_STATES =
    "DELETE FROM flow_state_archive WHERE flow_id=? AND tenant_id=?;";

}
