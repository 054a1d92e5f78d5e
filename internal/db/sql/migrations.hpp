#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flowstate::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the bookkeeping of applied
  versions in its flowstate_schema_migrations table.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Creates the bookkeeping table when missing and returns the highest
  // applied version (0 for a fresh database).
  virtual uint32_t AppliedVersion() = 0;

  virtual void RecordVersion(uint32_t version) = 0;
};

/*
  Runs migrations in order, skipping versions already applied.
  Returns the number of versions applied by this call.
*/

uint32_t RunMigrations(MigrationExecutor& executor, const std::vector<std::vector<std::string>>& ordered_sql);

} // namespace flowstate::db::sql
