#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/memory_cache_backend.hpp"
#include "internal/core/flow_cleanup.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if FLOWSTATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOWSTATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flowstate::factory {

using flowstate::observability::StringField;

namespace {

constexpr const char* kMigrationsTable = "flowstate_schema_migrations";

#if FLOWSTATE_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

  uint32_t AppliedVersion() override {
    db_->Exec(std::string("CREATE TABLE IF NOT EXISTS ") + kMigrationsTable + " (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(
        db_->Prepare(std::string("SELECT COALESCE(MAX(version), 0) FROM ") + kMigrationsTable + ";"), &sqlite3_finalize);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
      throw std::runtime_error(std::string("read ") + kMigrationsTable + ": " + sqlite3_errmsg(db_->Handle()));
    }
    return static_cast<uint32_t>(sqlite3_column_int64(st.get(), 0));
  }

  void RecordVersion(uint32_t version) override {
    db_->Exec(std::string("INSERT INTO ") + kMigrationsTable + " (version, applied_at_ms) VALUES (" + std::to_string(version) + ", " +
              std::to_string(util::NowMillis()) + ");");
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if FLOWSTATE_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(std::shared_ptr<pqxx::connection> conn) : conn_(std::move(conn)), tx_(*conn_) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  uint32_t AppliedVersion() override {
    tx_.exec(std::string("CREATE TABLE IF NOT EXISTS ") + kMigrationsTable + " (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);");
    return tx_.query_value<uint32_t>(std::string("SELECT COALESCE(MAX(version), 0) FROM ") + kMigrationsTable + ";");
  }

  void RecordVersion(uint32_t version) override {
    tx_.exec(std::string("INSERT INTO ") + kMigrationsTable + " (version, applied_at_ms) VALUES (" + std::to_string(version) + ", " +
             std::to_string(util::NowMillis()) + ");");
  }

  void Commit() {
    tx_.commit();
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  pqxx::work                        tx_;
};
#endif

std::shared_ptr<const codec::StateEncryption> BuildEncryption(const flowstate::runtime::config::RuntimeConfig& config) {
  if (config.encryption().enabled()) {
    return codec::StateEncryption::FromConfig(config.encryption());
  }

  // Field encryption is off; the cache still needs a key to seal entries.
  try {
    return codec::StateEncryption::FromConfig(config.encryption());
  } catch (const util::EncryptionError& ex) {
    FLOWSTATE_LOG_INFO("No state encryption key available", {StringField("detail", ex.what())});
    return nullptr;
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const flowstate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLOWSTATE_DB_SQLITE
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms() > 0 ? static_cast<int>(database.sqlite().busy_timeout_ms()) : 5000;
    auto       sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);

    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteMigrations());

    FLOWSTATE_LOG_INFO("Using sqlite repository", {StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOWSTATE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      PostgresMigrationExecutor executor(pool->Acquire());
      db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
      executor.Commit();
    }

    FLOWSTATE_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLOWSTATE_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const flowstate::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Codec and cache
  // ------------------------------------------------------------------
  deps.encryption = BuildEncryption(config);
  deps.codec      = std::make_shared<codec::StateCodec>(codec::CodecOptions::FromConfig(config), deps.encryption);

  auto cache_options = cache::CacheOptions::FromConfig(config);
  if (cache_options.enabled) {
    auto backend = std::make_shared<cache::MemoryCacheBackend>(static_cast<std::size_t>(config.cache().max_entries()));
    deps.cache   = std::make_shared<cache::SecureCache>(std::move(backend), deps.encryption, cache_options);
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  deps.store    = std::make_shared<store::FlowStateStore>(deps.repository, deps.codec, deps.cache, store::StoreOptions::FromConfig(config));
  deps.recovery = std::make_shared<recovery::RecoveryEngine>(deps.store, recovery::RecoveryOptions::FromConfig(config));

  auto cleanup  = std::make_shared<core::StoreFlowCleanup>(deps.store, config.retention().keep_versions());
  deps.manager  = std::make_shared<core::FlowStateManager>(deps.store, deps.recovery, std::move(cleanup));
  deps.migrator = std::make_shared<migration::StateMigrator>(deps.store);

  return deps;
}

} // namespace flowstate::factory
