#include "internal/migration/state_migrator.hpp"

#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/store/flow_state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstate::codec::CodecOptions;
using flowstate::codec::StateCodec;
using flowstate::db::memory::MemoryRepository;
using flowstate::migration::StateMigrator;
using flowstate::store::FlowStateStore;
using flowstate::store::StoreOptions;

namespace keys  = flowstate::state::keys;
namespace state = flowstate::state;
namespace util  = flowstate::util;

std::filesystem::path WriteLegacyDatabase(const std::string& name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flowstate_state_migrator_tests";
  std::filesystem::create_directories(base_dir);
  const auto path = base_dir / (name + ".sqlite");
  std::filesystem::remove(path);

  sqlite3* db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    throw std::runtime_error("cannot create legacy fixture");
  }

  const char* sql = R"(
CREATE TABLE discovery_flows (
  id TEXT, client_account_id TEXT, status TEXT, phase TEXT, progress REAL,
  data TEXT, created_at TEXT, updated_at TEXT);
INSERT INTO discovery_flows VALUES
  ('f-1', NULL, 'in_progress', 'data_import', 15, '{"rows":[1,2]}', '2024-01-01 10:00:00', '2024-01-02 10:00:00'),
  ('f-3', NULL, 'error', 'warp_zone', 10, NULL, NULL, NULL),
  (NULL, NULL, 'pending', NULL, NULL, NULL, NULL, NULL);

CREATE TABLE assessment_flow_runs (
  workflow_id TEXT, client_account_id TEXT, state TEXT, current_phase TEXT,
  progress_percentage INTEGER, created_at INTEGER, updated_at INTEGER);
INSERT INTO assessment_flow_runs VALUES
  ('f-2', 'acct-9', 'pending', NULL, NULL, 1704067200, 1704153600),
  ('r-1', NULL, 'completed', 'completed', 100, 1704067200, 1704153600);

CREATE TABLE flow_state (flow_id TEXT, tenant_id TEXT);
INSERT INTO flow_state VALUES ('own-row', 'tenant-x');

CREATE TABLE users (id TEXT);
INSERT INTO users VALUES ('not-a-flow');
)";

  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    sqlite3_close(db);
    throw std::runtime_error("legacy fixture: " + msg);
  }
  sqlite3_close(db);
  return path;
}

std::shared_ptr<FlowStateStore> MakeStore() {
  return std::make_shared<FlowStateStore>(std::make_shared<MemoryRepository>(), std::make_shared<StateCodec>(CodecOptions{}, nullptr),
                                          nullptr, StoreOptions{});
}

void TestDryRunWritesNothing() {
  const auto path  = WriteLegacyDatabase("dry_run");
  auto       store = MakeStore();
  StateMigrator migrator(store);

  auto report = migrator.Migrate(path.string(), "tenant-default", true);
  assert(report.dry_run);
  assert(report.tables_scanned == 2);
  assert(report.flows_found == 4);
  assert(report.migrated == 3);
  assert(report.failed == 2);
  assert(report.skipped == 0);
  assert(!report.validation_errors.empty());

  assert(store->ListFlows("tenant-default").empty());
  assert(store->ListFlows("acct-9").empty());
}

void TestMigrationMapsLegacyRows() {
  const auto path  = WriteLegacyDatabase("migrate");
  auto       store = MakeStore();
  StateMigrator migrator(store);

  auto report = migrator.Migrate(path.string(), "tenant-default", false);
  assert(report.migrated == 3);
  assert(report.failed == 2);

  auto f1 = store->Load("f-1", "tenant-default");
  assert(f1.has_value());
  assert(f1->version == 1);
  assert(f1->status == "running");
  assert(f1->phase == "data_import");
  assert(state::GetNumber(f1->state, keys::kProgress) == 15);
  assert(state::GetString(f1->state, keys::kCreatedAt) == "2024-01-01T10:00:00Z");
  const auto* raw = state::Find(f1->state, keys::kRawData);
  assert(raw && raw->struct_value().fields().at("rows").list_value().values_size() == 2);
  const auto* info = state::Find(f1->state, "migration_info");
  assert(info && info->struct_value().fields().at("source_table").string_value() == "discovery_flows");

  // tenant column wins over the default
  auto f2 = store->Load("f-2", "acct-9");
  assert(f2.has_value());
  assert(f2->status == "initialized");
  assert(f2->phase == "initialization");
  assert(state::GetString(f2->state, keys::kCreatedAt) == "2024-01-01T00:00:00Z");
  assert(!store->Load("f-2", "tenant-default").has_value());

  auto r1 = store->Load("r-1", "tenant-default");
  assert(r1->status == "completed");
  assert(!state::GetString(r1->state, keys::kCompletedAt).empty());

  assert(!store->Load("f-3", "tenant-default").has_value());
  assert(!store->Load("own-row", "tenant-x").has_value());
  assert(!store->Load("not-a-flow", "tenant-default").has_value());
}

void TestExistingFlowsAreSkipped() {
  const auto path  = WriteLegacyDatabase("rerun");
  auto       store = MakeStore();
  StateMigrator migrator(store);

  migrator.Migrate(path.string(), "tenant-default", false);
  store->Save("f-1", "tenant-default", store->Load("f-1", "tenant-default")->state, "");

  auto again = migrator.Migrate(path.string(), "tenant-default", false);
  assert(again.migrated == 0);
  assert(again.skipped == 3);
  assert(store->Load("f-1", "tenant-default")->version == 2);
}

void TestMapRowDefaults() {
  google::protobuf::Struct row;
  (*row.mutable_fields())["execution_id"] = state::MakeNumber(42);
  (*row.mutable_fields())["status"]       = state::MakeString("running");
  (*row.mutable_fields())["input_data"]   = state::MakeString("not json");

  std::string error;
  auto        doc = StateMigrator::MapRow(row, "workflow_flows", "tenant-default", &error);
  assert(doc.has_value());
  assert(state::GetString(*doc, keys::kFlowId) == "42");
  assert(state::GetString(*doc, keys::kTenantId) == "tenant-default");
  assert(state::GetString(*doc, keys::kRawData) == "not json");
  assert(state::StateValidator::Validate(*doc).valid);

  google::protobuf::Struct empty;
  assert(!StateMigrator::MapRow(empty, "workflow_flows", "tenant-default", &error).has_value());
  assert(error.find("no flow id") != std::string::npos);

  assert(StateMigrator::NormalizeStatus("pending") == "initialized");
  assert(StateMigrator::NormalizeStatus("in_progress") == "running");
  assert(StateMigrator::NormalizeStatus("error") == "failed");
  assert(StateMigrator::NormalizeStatus("paused") == "paused");
}

void TestMissingDatabaseIsAStorageError() {
  StateMigrator migrator(MakeStore());
  bool          threw = false;
  try {
    migrator.Migrate((std::filesystem::temp_directory_path() / "flowstate_no_such_legacy.sqlite").string(), "t", true);
  } catch (const util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDryRunWritesNothing();
  TestMigrationMapsLegacyRows();
  TestExistingFlowsAreSkipped();
  TestMapRowDefaults();
  TestMissingDatabaseIsAStorageError();

  std::cout << "flowstate_unit_state_migrator: pass\n";
  return 0;
}
