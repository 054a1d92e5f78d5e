#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/flow_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
using flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;
using flowstate::runtime::config::SerializationFormat;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowstatectl --config <file> show <tenant> <flow>\n"
            << "  flowstatectl --config <file> list <tenant>\n"
            << "  flowstatectl --config <file> versions <tenant> <flow>\n"
            << "  flowstatectl --config <file> checkpoints <tenant> <flow>\n"
            << "  flowstatectl --config <file> checkpoint <tenant> <flow> [phase]\n"
            << "  flowstatectl --config <file> recover <tenant> <flow>\n"
            << "  flowstatectl --config <file> export <tenant> <flow> [json|binary] [--include-sensitive]\n"
            << "  flowstatectl --config <file> import <tenant> <flow> <file> [json|binary]\n"
            << "  flowstatectl --config <file> cleanup <tenant> <flow>\n"
            << "  flowstatectl --config <file> archives <tenant> <flow>\n"
            << "  flowstatectl --config <file> migrate <legacy.sqlite> <tenant> [--dry-run]\n";
}

static SerializationFormat ParseFormat(const std::string& value) {
  if (value == "json") return SERIALIZATION_FORMAT_JSON;
  if (value == "binary") return SERIALIZATION_FORMAT_BINARY;
  throw std::invalid_argument("unsupported format: " + value);
}

static std::string FormatMillis(uint64_t ms) {
  return flowstate::util::ToRfc3339(flowstate::util::FromUnixMillis(ms));
}

static int Run(flowstate::factory::RuntimeDependencies& deps, const std::vector<std::string>& args) {
  const auto& cmd  = args[0];
  auto&       mgr  = *deps.manager;
  auto&       store = *deps.store;

  auto need = [&](std::size_t count) {
    if (args.size() < count + 1) {
      Usage();
      return false;
    }
    return true;
  };

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (!need(1)) return 1;
    for (const auto& flow : store.ListFlows(args[1])) {
      std::cout << flow.flow_id << "\tv" << flow.version << "\t" << flow.phase << "\t" << flow.status << "\t" << FormatMillis(flow.updated_at_ms)
                << "\n";
    }
    return 0;
  }

  if (cmd == "migrate") {
    if (!need(2)) return 1;
    const bool dry_run = args.size() > 3 && args[3] == "--dry-run";
    auto       report  = deps.migrator->Migrate(args[1], args[2], dry_run);
    std::cout << "tables_scanned=" << report.tables_scanned << " flows_found=" << report.flows_found << " migrated=" << report.migrated
              << " skipped=" << report.skipped << " failed=" << report.failed << (dry_run ? " (dry run)" : "") << "\n";
    for (const auto& err : report.validation_errors) {
      std::cout << "  " << err << "\n";
    }
    return report.failed == 0 ? 0 : 2;
  }

  if (!need(2)) return 1;
  const auto& tenant = args[1];
  const auto& flow   = args[2];

  if (cmd == "show") {
    auto loaded = mgr.Get(flow, tenant);
    if (!loaded) {
      std::cerr << "flow not found\n";
      return 3;
    }
    std::cout << "version: " << loaded->version << "\nphase: " << loaded->phase << "\nstatus: " << loaded->status << "\n"
              << flowstate::state::ToJson(loaded->state) << "\n";
    return 0;
  }

  if (cmd == "versions") {
    for (const auto& v : store.GetVersions(flow, tenant)) {
      std::cout << "v" << v.version << "\t" << v.phase << "\t" << v.status << "\t" << FormatMillis(v.created_at_ms) << "\n";
    }
    return 0;
  }

  if (cmd == "checkpoints") {
    for (const auto& cp : store.ListCheckpoints(flow, tenant)) {
      std::cout << cp.checkpoint_id << "\t" << cp.phase << "\tv" << cp.state_version << "\t" << FormatMillis(cp.created_at_ms)
                << (cp.decodable ? "" : "\t(undecodable)") << "\n";
    }
    return 0;
  }

  if (cmd == "checkpoint") {
    std::cout << store.CreateCheckpoint(flow, tenant, args.size() > 3 ? args[3] : "") << "\n";
    return 0;
  }

  if (cmd == "recover") {
    auto result = mgr.Recover(flow, tenant);
    std::cout << "outcome: " << flowstate::recovery::ToString(result.outcome) << "\nversion: " << result.version << "\n";
    if (!result.checkpoint_id.empty()) std::cout << "checkpoint: " << result.checkpoint_id << "\n";
    if (!result.archive_id.empty()) std::cout << "archive: " << result.archive_id << "\n";
    for (const auto& action : result.actions) {
      std::cout << "  " << action << "\n";
    }
    std::cout << "detail: " << result.detail << "\n";
    return result.outcome == flowstate::recovery::RecoveryOutcome::kManualInterventionRequired ? 2 : 0;
  }

  if (cmd == "export") {
    SerializationFormat format            = SERIALIZATION_FORMAT_JSON;
    bool                include_sensitive = false;
    for (std::size_t i = 3; i < args.size(); ++i) {
      if (args[i] == "--include-sensitive") {
        include_sensitive = true;
      } else {
        format = ParseFormat(args[i]);
      }
    }
    std::cout << mgr.Export(flow, tenant, format, include_sensitive);
    return 0;
  }

  if (cmd == "import") {
    if (!need(3)) return 1;
    std::ifstream in(args[3], std::ios::binary);
    if (!in) {
      std::cerr << "cannot read " << args[3] << "\n";
      return 1;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto        imported = mgr.Import(flow, tenant, bytes, args.size() > 4 ? ParseFormat(args[4]) : SERIALIZATION_FORMAT_JSON);
    std::cout << "imported " << flow << " at version " << imported.version << "\n";
    return 0;
  }

  if (cmd == "cleanup") {
    auto report = mgr.Cleanup(flow, tenant);
    std::cout << "checkpoint: " << report.checkpoint_id << "\nversions_removed: " << report.versions_removed << "\n";
    return 0;
  }

  if (cmd == "archives") {
    for (const auto& archive : store.ListArchivedSnapshots(flow, tenant)) {
      std::cout << archive.archive_id << "\tv" << archive.version << "\t" << archive.size_bytes << "B\t" << FormatMillis(archive.archived_at_ms)
                << "\t" << archive.reason << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flowstate::config::ConfigLoader::LoadFromYaml(config_path);

    flowstate::observability::InitializeTracing(config);
    flowstate::observability::InitializeMetrics(config);
    flowstate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto deps = flowstate::factory::BuildRuntime(config);
    int  rc   = Run(deps, args);

    flowstate::observability::ShutdownLogging();
    flowstate::observability::ShutdownMetrics();
    flowstate::observability::ShutdownTracing();
    return rc;
  } catch (const flowstate::util::FlowStateError& e) {
    FLOWSTATE_LOG_ERROR("Command failed", {flowstate::observability::StringField("kind", flowstate::util::ToString(e.Kind())),
                                           flowstate::observability::StringField("error", e.what())});
    std::cerr << flowstate::util::ToString(e.Kind()) << ": " << e.what() << "\n";
  } catch (const std::exception& e) {
    FLOWSTATE_LOG_ERROR("Fatal error", {flowstate::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
  }

  flowstate::observability::ShutdownLogging();
  flowstate::observability::ShutdownMetrics();
  flowstate::observability::ShutdownTracing();
  return 2;
}
