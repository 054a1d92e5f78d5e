#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/state/flow_state.hpp"

namespace flowstate::store {
class FlowStateStore;
}

namespace flowstate::migration {

struct MigrationReport {
  bool                     dry_run        = false;
  std::size_t              tables_scanned = 0;
  std::size_t              flows_found    = 0;
  // in a dry run: rows that would be migrated
  std::size_t              migrated = 0;
  std::size_t              skipped  = 0;
  std::size_t              failed   = 0;
  std::vector<std::string> validation_errors;
};

/*
  Imports flow state rows from a legacy SQLite database.

  Every table whose name contains "flow" is scanned. Columns are mapped by
  name onto the state document, missing fields get defaults and legacy
  status names are normalized. Rows are validated before anything is
  written; flows that already exist are skipped, never overwritten.
*/
class StateMigrator {
 public:
  explicit StateMigrator(std::shared_ptr<store::FlowStateStore> store);

  // Throws StorageError when the legacy database cannot be opened.
  MigrationReport Migrate(const std::string& legacy_sqlite_path, const std::string& tenant_id, bool dry_run);

  // Maps one legacy row (column name -> value) to a state document.
  // Returns nullopt, with a message in error, when the row has no usable
  // flow id.
  static std::optional<state::State> MapRow(const google::protobuf::Struct& row, const std::string& source_table,
                                            const std::string& default_tenant_id, std::string* error);

  static std::string NormalizeStatus(const std::string& legacy_status);

 private:
  std::shared_ptr<store::FlowStateStore> store_;
};

} // namespace flowstate::migration
