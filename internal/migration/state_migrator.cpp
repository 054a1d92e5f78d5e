#include "internal/migration/state_migrator.hpp"

#include <sqlite3.h>

#include <google/protobuf/util/json_util.h>

#include <array>
#include <cmath>
#include <memory>
#include <set>

#include "internal/model/flow_phase.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/store/flow_state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstate::migration {

using flowstate::observability::IntField;
using flowstate::observability::StringField;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace keys = flowstate::state::keys;

namespace {

using Database  = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr std::array<const char*, 4> kFlowIdColumns   = {"id", "flow_id", "execution_id", "workflow_id"};
constexpr std::array<const char*, 2> kStatusColumns   = {"state", "status"};
constexpr std::array<const char*, 2> kPhaseColumns    = {"phase", "current_phase"};
constexpr std::array<const char*, 2> kProgressColumns = {"progress", "progress_percentage"};
constexpr std::array<const char*, 4> kDataColumns     = {"data", "input_data", "flow_data", "raw_data"};
constexpr std::array<const char*, 2> kTenantColumns   = {"client_account_id", "tenant_id"};

// Tables written by this engine's own schema.
const std::set<std::string> kOwnTables = {"flow_state", "flow_state_versions", "flow_state_archive", "flowstate_schema_migrations"};

template <std::size_t N>
const Value* FirstPresent(const Struct& row, const std::array<const char*, N>& columns) {
  for (const char* column : columns) {
    const auto it = row.fields().find(column);
    if (it != row.fields().end() && it->second.kind_case() != Value::kNullValue && it->second.kind_case() != Value::KIND_NOT_SET) {
      if (it->second.kind_case() == Value::kStringValue && it->second.string_value().empty()) {
        continue;
      }
      return &it->second;
    }
  }
  return nullptr;
}

std::string AsText(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) {
    const double n = value.number_value();
    if (std::floor(n) == n) {
      return std::to_string(static_cast<long long>(n));
    }
    return std::to_string(n);
  }
  if (value.kind_case() == Value::kStringValue) {
    return value.string_value();
  }
  return {};
}

std::optional<double> AsNumber(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) {
    return value.number_value();
  }
  if (value.kind_case() == Value::kStringValue) {
    try {
      std::size_t consumed = 0;
      const auto  n        = std::stod(value.string_value(), &consumed);
      if (consumed == value.string_value().size()) {
        return n;
      }
    } catch (const std::logic_error&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

// Accepts RFC 3339, "YYYY-MM-DD HH:MM:SS[.fff]" (taken as UTC) and unix seconds.
std::optional<std::string> NormalizeTimestamp(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) {
    return util::ToRfc3339(util::FromUnixMillis(static_cast<uint64_t>(value.number_value() * 1000)));
  }
  if (value.kind_case() != Value::kStringValue) {
    return std::nullopt;
  }

  std::string text = value.string_value();
  if (auto parsed = util::ParseRfc3339(text)) {
    return util::ToRfc3339(*parsed);
  }
  if (text.size() > 10 && text[10] == ' ') {
    text[10] = 'T';
  }
  if (text.find('Z') == std::string::npos && text.find('+', 10) == std::string::npos) {
    text += 'Z';
  }
  if (auto parsed = util::ParseRfc3339(text)) {
    return util::ToRfc3339(*parsed);
  }
  return std::nullopt;
}

Value ParseLegacyData(const Value& value) {
  if (value.kind_case() != Value::kStringValue) {
    return value;
  }
  Value      parsed;
  const auto status = google::protobuf::util::JsonStringToMessage(value.string_value(), &parsed);
  return status.ok() ? parsed : value;
}

Value ColumnValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return state::MakeNumber(static_cast<double>(sqlite3_column_int64(st, col)));
    case SQLITE_FLOAT:
      return state::MakeNumber(sqlite3_column_double(st, col));
    case SQLITE_NULL:
      return state::MakeNull();
    default: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
      return state::MakeString(text ? std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string());
    }
  }
}

std::string QuoteIdentifier(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    out += c;
    if (c == '"') {
      out += '"';
    }
  }
  return out + "\"";
}

std::vector<std::string> ListFlowTables(sqlite3* db) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT name FROM sqlite_master WHERE type='table' AND name LIKE '%flow%' ORDER BY name;", -1, &raw, nullptr) !=
      SQLITE_OK) {
    throw util::StorageError(std::string("list legacy tables: ") + sqlite3_errmsg(db));
  }
  Statement st(raw, &sqlite3_finalize);

  std::vector<std::string> tables;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    std::string name(reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0)));
    if (kOwnTables.count(name) == 0 && name.rfind("sqlite_", 0) != 0) {
      tables.push_back(std::move(name));
    }
  }
  return tables;
}

} // namespace

StateMigrator::StateMigrator(std::shared_ptr<store::FlowStateStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("StateMigrator requires a store");
  }
}

std::string StateMigrator::NormalizeStatus(const std::string& legacy_status) {
  if (legacy_status == "pending") {
    return std::string(model::ToString(model::Status::kInitialized));
  }
  if (legacy_status == "in_progress") {
    return std::string(model::ToString(model::Status::kRunning));
  }
  if (legacy_status == "error") {
    return std::string(model::ToString(model::Status::kFailed));
  }
  return legacy_status;
}

std::optional<state::State> StateMigrator::MapRow(const Struct& row, const std::string& source_table, const std::string& default_tenant_id,
                                                  std::string* error) {
  const auto* id_value = FirstPresent(row, kFlowIdColumns);
  const auto  flow_id  = id_value ? AsText(*id_value) : std::string();
  if (flow_id.empty()) {
    if (error) {
      *error = source_table + ": row has no flow id column";
    }
    return std::nullopt;
  }

  const auto* tenant_value = FirstPresent(row, kTenantColumns);
  const auto  tenant_id    = tenant_value ? AsText(*tenant_value) : default_tenant_id;

  const auto* data = FirstPresent(row, kDataColumns);
  auto        doc  = state::NewInitialState(flow_id, tenant_id, data ? ParseLegacyData(*data) : state::MakeEmptyList());

  std::string phase(model::ToString(model::Phase::kInitialization));
  if (const auto* value = FirstPresent(row, kPhaseColumns)) {
    phase = AsText(*value);
  }
  state::SetString(&doc, keys::kCurrentPhase, phase);

  if (const auto* value = FirstPresent(row, kStatusColumns)) {
    state::SetString(&doc, keys::kStatus, NormalizeStatus(AsText(*value)));
  }

  if (const auto* value = FirstPresent(row, kProgressColumns)) {
    if (auto progress = AsNumber(*value)) {
      state::SetNumber(&doc, keys::kProgress, *progress);
    } else {
      state::Set(&doc, keys::kProgress, *value);
    }
  } else if (auto known = model::ParsePhase(phase)) {
    state::SetNumber(&doc, keys::kProgress, model::ProgressFor(*known));
  }

  for (auto key : {keys::kCreatedAt, keys::kUpdatedAt}) {
    const auto it = row.fields().find(std::string(key));
    if (it == row.fields().end() || it->second.kind_case() == Value::kNullValue) {
      continue;
    }
    if (auto normalized = NormalizeTimestamp(it->second)) {
      state::SetString(&doc, key, *normalized);
    } else {
      state::Set(&doc, key, it->second);
    }
  }
  if (state::GetString(doc, keys::kStatus) == model::ToString(model::Status::kCompleted)) {
    state::SetString(&doc, keys::kCompletedAt, state::GetString(doc, keys::kUpdatedAt));
  }

  Value info = state::MakeEmptyStruct();
  auto* info_fields = info.mutable_struct_value()->mutable_fields();
  (*info_fields)["source_table"] = state::MakeString(source_table);
  (*info_fields)["migrated_at"]  = state::MakeString(util::NowRfc3339());
  state::Set(&doc, "migration_info", std::move(info));
  state::AppendLog(&doc, "migrated", "Flow state migrated from legacy table " + source_table, state::GetString(doc, keys::kCurrentPhase));
  return doc;
}

MigrationReport StateMigrator::Migrate(const std::string& legacy_sqlite_path, const std::string& tenant_id, bool dry_run) {
  sqlite3* raw_db = nullptr;
  if (sqlite3_open_v2(legacy_sqlite_path.c_str(), &raw_db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    std::string msg = raw_db ? sqlite3_errmsg(raw_db) : "unknown error";
    sqlite3_close(raw_db);
    throw util::StorageError("open legacy database " + legacy_sqlite_path + ": " + msg);
  }
  Database db(raw_db, &sqlite3_close);

  MigrationReport report;
  report.dry_run = dry_run;

  for (const auto& table : ListFlowTables(db.get())) {
    ++report.tables_scanned;

    sqlite3_stmt* raw_st = nullptr;
    const auto    sql    = "SELECT * FROM " + QuoteIdentifier(table) + ";";
    if (sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw_st, nullptr) != SQLITE_OK) {
      report.validation_errors.push_back(table + ": " + sqlite3_errmsg(db.get()));
      continue;
    }
    Statement st(raw_st, &sqlite3_finalize);

    const int columns = sqlite3_column_count(st.get());
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      Struct row;
      for (int col = 0; col < columns; ++col) {
        (*row.mutable_fields())[sqlite3_column_name(st.get(), col)] = ColumnValue(st.get(), col);
      }

      std::string map_error;
      auto        doc = MapRow(row, table, tenant_id, &map_error);
      if (!doc) {
        ++report.failed;
        report.validation_errors.push_back(map_error);
        continue;
      }
      ++report.flows_found;

      const auto flow_id   = state::GetString(*doc, keys::kFlowId);
      const auto flow_tenant = state::GetString(*doc, keys::kTenantId);
      const auto validation  = state::StateValidator::Validate(*doc);
      if (!validation.valid) {
        ++report.failed;
        for (const auto& err : validation.errors) {
          report.validation_errors.push_back(table + "/" + flow_id + ": " + err);
        }
        continue;
      }

      if (store_->LoadRaw(flow_id, flow_tenant)) {
        ++report.skipped;
        continue;
      }
      if (dry_run) {
        ++report.migrated;
        continue;
      }

      try {
        store_->Save(flow_id, flow_tenant, *doc, state::GetString(*doc, keys::kCurrentPhase), 0);
        ++report.migrated;
      } catch (const util::ConcurrentModificationError&) {
        ++report.skipped;
      } catch (const util::FlowStateError& ex) {
        ++report.failed;
        report.validation_errors.push_back(table + "/" + flow_id + ": " + ex.what());
      }
    }
  }

  FLOWSTATE_LOG_INFO("Legacy state migration finished",
                     {StringField("source", legacy_sqlite_path), StringField("tenant_id", tenant_id), observability::BoolField("dry_run", dry_run),
                      IntField("tables_scanned", static_cast<int64_t>(report.tables_scanned)),
                      IntField("flows_found", static_cast<int64_t>(report.flows_found)), IntField("migrated", static_cast<int64_t>(report.migrated)),
                      IntField("skipped", static_cast<int64_t>(report.skipped)), IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

} // namespace flowstate::migration
