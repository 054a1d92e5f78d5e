#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace flowstate::db::sql {

uint32_t RunMigrations(MigrationExecutor& executor, const std::vector<std::vector<std::string>>& ordered_sql) {
  const uint32_t applied = executor.AppliedVersion();
  uint32_t       ran     = 0;

  for (uint32_t version = applied + 1; version <= ordered_sql.size(); ++version) {
    for (const auto& statement : ordered_sql[version - 1]) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(version);
    ++ran;
  }

  if (ran > 0) {
    FLOWSTATE_LOG_INFO("Applied schema migrations", {observability::IntField("from_version", applied),
                                                     observability::IntField("to_version", applied + ran)});
  }
  return ran;
}

} // namespace flowstate::db::sql
