#include "pg_pool.hpp"

namespace flowstate::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        --live_connections_;
        continue;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_flow_state",
               "INSERT INTO flow_state(flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_flow_state",
               "SELECT flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms "
               "FROM flow_state WHERE flow_id=$1 AND tenant_id=$2");

  // row lock held until commit; serializes checkpoint ring rewrites
  conn.prepare("get_flow_state_for_update",
               "SELECT flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms "
               "FROM flow_state WHERE flow_id=$1 AND tenant_id=$2 FOR UPDATE");

  conn.prepare("list_flow_states",
               "SELECT flow_id,tenant_id,version,phase,status,state_blob,checkpoints_blob,created_at_ms,updated_at_ms "
               "FROM flow_state WHERE tenant_id=$1 ORDER BY flow_id");

  // compare-and-set on version, evaluated under the row lock
  conn.prepare("update_flow_state",
               "UPDATE flow_state SET version=$1,phase=$2,status=$3,state_blob=$4,updated_at_ms=$5 "
               "WHERE flow_id=$6 AND tenant_id=$7 AND version=$8");

  conn.prepare("get_flow_state_version", "SELECT version FROM flow_state WHERE flow_id=$1 AND tenant_id=$2");

  conn.prepare("update_flow_checkpoints", "UPDATE flow_state SET checkpoints_blob=$1 WHERE flow_id=$2 AND tenant_id=$3");

  conn.prepare("delete_flow_state", "DELETE FROM flow_state WHERE flow_id=$1 AND tenant_id=$2");
  conn.prepare("delete_flow_versions", "DELETE FROM flow_state_versions WHERE flow_id=$1 AND tenant_id=$2");
  conn.prepare("delete_archived_states", "DELETE FROM flow_state_archive WHERE flow_id=$1 AND tenant_id=$2");

  conn.prepare("insert_flow_version",
               "INSERT INTO flow_state_versions(flow_id,tenant_id,version,phase,status,state_blob,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("list_flow_versions",
               "SELECT flow_id,tenant_id,version,phase,status,state_blob,created_at_ms "
               "FROM flow_state_versions WHERE flow_id=$1 AND tenant_id=$2 ORDER BY version ASC");

  conn.prepare("delete_flow_versions_below", "DELETE FROM flow_state_versions WHERE flow_id=$1 AND tenant_id=$2 AND version<$3");

  conn.prepare("insert_archived_state",
               "INSERT INTO flow_state_archive(archive_id,flow_id,tenant_id,version,reason,state_blob,archived_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("list_archived_states",
               "SELECT archive_id,flow_id,tenant_id,version,reason,state_blob,archived_at_ms "
               "FROM flow_state_archive WHERE flow_id=$1 AND tenant_id=$2 ORDER BY seq ASC");

  conn.prepare("trim_archived_states",
               "DELETE FROM flow_state_archive WHERE flow_id=$1 AND tenant_id=$2 AND seq NOT IN "
               "(SELECT seq FROM flow_state_archive WHERE flow_id=$1 AND tenant_id=$2 ORDER BY seq DESC LIMIT $3)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace flowstate::db::postgres
