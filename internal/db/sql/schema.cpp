#include "schema.hpp"

namespace flowstate::db::sql {

const std::vector<std::vector<std::string>>& SqliteMigrations() {
  static const std::vector<std::vector<std::string>> kMigrations = {
      {
          "CREATE TABLE IF NOT EXISTS flow_state (flow_id TEXT NOT NULL, tenant_id TEXT NOT NULL, version INTEGER NOT NULL, phase TEXT NOT NULL, "
          "status TEXT NOT NULL, state_blob BLOB NOT NULL, checkpoints_blob BLOB NOT NULL DEFAULT x'', created_at_ms INTEGER NOT NULL, "
          "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (flow_id, tenant_id));",
          "CREATE INDEX IF NOT EXISTS flow_state_tenant_status ON flow_state(tenant_id, status);",
          "CREATE TABLE IF NOT EXISTS flow_state_versions (flow_id TEXT NOT NULL, tenant_id TEXT NOT NULL, version INTEGER NOT NULL, phase TEXT NOT NULL, "
          "status TEXT NOT NULL, state_blob BLOB NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (flow_id, tenant_id, version));",
      },
      {
          "CREATE TABLE IF NOT EXISTS flow_state_archive (seq INTEGER PRIMARY KEY AUTOINCREMENT, archive_id TEXT NOT NULL UNIQUE, flow_id TEXT NOT NULL, "
          "tenant_id TEXT NOT NULL, version INTEGER NOT NULL, reason TEXT NOT NULL, state_blob BLOB NOT NULL, archived_at_ms INTEGER NOT NULL);",
          "CREATE INDEX IF NOT EXISTS flow_state_archive_flow ON flow_state_archive(flow_id, tenant_id);",
      },
  };
  return kMigrations;
}

const std::vector<std::vector<std::string>>& PostgresMigrations() {
  static const std::vector<std::vector<std::string>> kMigrations = {
      {
          "CREATE TABLE IF NOT EXISTS flow_state (flow_id TEXT NOT NULL, tenant_id TEXT NOT NULL, version BIGINT NOT NULL, phase TEXT NOT NULL, "
          "status TEXT NOT NULL, state_blob BYTEA NOT NULL, checkpoints_blob BYTEA NOT NULL DEFAULT ''::bytea, created_at_ms BIGINT NOT NULL, "
          "updated_at_ms BIGINT NOT NULL, PRIMARY KEY (flow_id, tenant_id));",
          "CREATE INDEX IF NOT EXISTS flow_state_tenant_status ON flow_state(tenant_id, status);",
          "CREATE TABLE IF NOT EXISTS flow_state_versions (flow_id TEXT NOT NULL, tenant_id TEXT NOT NULL, version BIGINT NOT NULL, phase TEXT NOT NULL, "
          "status TEXT NOT NULL, state_blob BYTEA NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (flow_id, tenant_id, version));",
      },
      {
          "CREATE TABLE IF NOT EXISTS flow_state_archive (seq BIGSERIAL PRIMARY KEY, archive_id TEXT NOT NULL UNIQUE, flow_id TEXT NOT NULL, "
          "tenant_id TEXT NOT NULL, version BIGINT NOT NULL, reason TEXT NOT NULL, state_blob BYTEA NOT NULL, archived_at_ms BIGINT NOT NULL);",
          "CREATE INDEX IF NOT EXISTS flow_state_archive_flow ON flow_state_archive(flow_id, tenant_id);",
      },
  };
  return kMigrations;
}

} // namespace flowstate::db::sql
