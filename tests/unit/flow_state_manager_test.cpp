#include "internal/core/flow_state_manager.hpp"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/codec/compression.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstate::core::FlowStateManager;
using flowstate::recovery::RecoveryOutcome;
using flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
using flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;
using google::protobuf::Struct;

namespace keys  = flowstate::state::keys;
namespace state = flowstate::state;
namespace util  = flowstate::util;

constexpr const char* kSecret = "sk-live-manager-secret";

flowstate::factory::RuntimeDependencies MakeRuntime(std::uint64_t max_state_bytes = 0) {
  auto config = flowstate::config::ConfigLoader::Defaults();
  config.mutable_retention()->set_keep_versions(3);
  if (max_state_bytes != 0) {
    config.mutable_serialization()->set_max_state_bytes(max_state_bytes);
  }
  return flowstate::factory::BuildRuntime(config);
}

Struct Fields(std::initializer_list<std::pair<std::string, google::protobuf::Value>> values) {
  Struct out;
  for (const auto& [key, value] : values) {
    (*out.mutable_fields())[key] = value;
  }
  return out;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

const google::protobuf::Struct& LastLog(const state::State& doc) {
  const auto& log = state::Find(doc, keys::kWorkflowLog)->list_value();
  return log.values(log.values_size() - 1).struct_value();
}

void TestCreate() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;

  auto created = mgr.Create("flow-1", "tenant-a", state::MakeEmptyList(),
                            Fields({{"source", state::MakeString("crm")}, {"flow_id", state::MakeString("hijack")}}));
  assert(created.version == 1);
  assert(created.phase == "initialization");
  assert(created.status == "initialized");
  assert(state::GetString(created.state, "source") == "crm");
  assert(state::GetString(created.state, keys::kFlowId) == "flow-1");
  assert(LastLog(created.state).fields().at("event").string_value() == "flow_created");

  assert(Throws<util::AlreadyExistsError>([&] { mgr.Create("flow-1", "tenant-a", state::MakeEmptyList()); }));
  assert(!mgr.Get("flow-1", "tenant-b").has_value());
}

void TestUpdateRejectsProtectedKeys() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());

  auto updated = mgr.Update("flow-1", "tenant-a", Fields({{"api_keys", state::MakeString(kSecret)}}), 1);
  assert(updated.version == 2);
  assert(state::GetString(mgr.Get("flow-1", "tenant-a")->state, "api_keys") == kSecret);

  assert(Throws<util::ValidationError>([&] { mgr.Update("flow-1", "tenant-a", Fields({{"created_at", state::MakeString("x")}})); }));
  assert(Throws<util::ConcurrentModificationError>([&] { mgr.Update("flow-1", "tenant-a", Fields({{"a", state::MakeBool(true)}}), 1); }));
  assert(Throws<util::NotFoundError>([&] { mgr.Update("ghost", "tenant-a", Fields({{"a", state::MakeBool(true)}})); }));
}

void TestTransitionGraph() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());

  auto moved = mgr.TransitionPhase("flow-1", "tenant-a", "data_import");
  assert(moved.version == 2);
  assert(moved.phase == "data_import");
  assert(moved.status == "running");
  assert(state::GetNumber(moved.state, keys::kProgress) == 15);
  assert(LastLog(moved.state).fields().at("from_phase").string_value() == "initialization");
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a").size() == 1);
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a")[0].phase == "initialization");

  // skipping ahead needs force
  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "dependency_analysis"); }));
  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "initialization"); }));
  assert(Throws<util::ValidationError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "warp"); }));
  assert(Throws<util::ConcurrentModificationError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "field_mapping", false, 1); }));
  assert(mgr.Get("flow-1", "tenant-a")->version == 2);

  auto forced = mgr.TransitionPhase("flow-1", "tenant-a", "tech_debt_analysis", true, 2);
  assert(forced.phase == "tech_debt_analysis");
  assert(state::GetNumber(forced.state, keys::kProgress) == 90);
  assert(LastLog(forced.state).fields().at("forced").bool_value());

  auto done = mgr.TransitionPhase("flow-1", "tenant-a", "completed");
  assert(done.status == "completed");
  assert(state::GetNumber(done.state, keys::kProgress) == 100);
  assert(!state::GetString(done.state, keys::kCompletedAt).empty());

  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "data_import"); }));
}

void TestTerminalFlowsNeedForceToMove() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;

  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());
  mgr.Cancel("flow-1", "tenant-a");
  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "data_import"); }));
  auto cancelled = mgr.Get("flow-1", "tenant-a");
  assert(cancelled->status == "cancelled");
  assert(cancelled->phase == "initialization");
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a").empty());

  auto forced = mgr.TransitionPhase("flow-1", "tenant-a", "data_import", true);
  assert(forced.status == "running");
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a").size() == 1);

  mgr.Create("flow-2", "tenant-a", state::MakeEmptyList());
  mgr.Update("flow-2", "tenant-a", Fields({{"status", state::MakeString("failed")}}));
  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-2", "tenant-a", "data_import"); }));
  assert(mgr.Get("flow-2", "tenant-a")->status == "failed");
  assert(rt.store->ListCheckpoints("flow-2", "tenant-a").empty());
}

void TestRejectedTransitionLeavesNoCheckpoint() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());

  assert(Throws<util::ConcurrentModificationError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "data_import", false, 7); }));
  assert(Throws<util::InvalidTransitionError>([&] { mgr.TransitionPhase("flow-1", "tenant-a", "field_mapping"); }));
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a").empty());

  // the checkpoint id logged by the transition is the one in the ring
  auto moved       = mgr.TransitionPhase("flow-1", "tenant-a", "data_import");
  auto checkpoints = rt.store->ListCheckpoints("flow-1", "tenant-a");
  assert(checkpoints.size() == 1);
  assert(checkpoints[0].state_version == 1);
  assert(LastLog(moved.state).fields().at("checkpoint_id").string_value() == checkpoints[0].checkpoint_id);
}

void TestCompletePhaseRecordsResults() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());
  mgr.TransitionPhase("flow-1", "tenant-a", "data_import");

  auto out = mgr.CompletePhase("flow-1", "tenant-a", "data_import", Fields({{"rows", state::MakeNumber(42)}}));
  const auto& completion = state::Find(out.state, keys::kPhaseCompletion)->struct_value().fields();
  assert(completion.at("data_import").bool_value());
  assert(!completion.at("field_mapping").bool_value());

  const auto& results = state::Find(out.state, keys::kPhaseResults)->struct_value().fields();
  assert(results.at("data_import").struct_value().fields().at("rows").number_value() == 42);

  auto checkpoints = rt.store->ListCheckpoints("flow-1", "tenant-a");
  assert(checkpoints.size() == 2);
  assert(checkpoints.back().phase == "data_import");
  assert(checkpoints.back().state_version == out.version);

  assert(Throws<util::ValidationError>([&] { mgr.CompletePhase("flow-1", "tenant-a", "nope", Struct{}); }));
}

void TestHandleErrorRecovers() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;

  // no checkpoint yet: repaired in place, error kept
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());
  auto repaired = mgr.HandleError("flow-1", "tenant-a", "initialization", "boom", Fields({{"code", state::MakeNumber(7)}}));
  assert(repaired.outcome == RecoveryOutcome::kRepaired);
  auto after = mgr.Get("flow-1", "tenant-a");
  assert(after->status == "running");
  assert(state::ListSize(after->state, keys::kErrors) == 1);

  // with a checkpoint: rolled back to it
  mgr.Create("flow-2", "tenant-a", state::MakeEmptyList());
  mgr.TransitionPhase("flow-2", "tenant-a", "data_import");
  auto restored = mgr.HandleError("flow-2", "tenant-a", "data_import", "import crashed");
  assert(restored.outcome == RecoveryOutcome::kRecoveredFromCheckpoint);
  auto flow2 = mgr.Get("flow-2", "tenant-a");
  assert(flow2->status == "running");
  assert(flow2->phase == "initialization");
  assert(flow2->version == restored.version);
}

void TestPauseResumeCancel() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());

  assert(Throws<util::InvalidTransitionError>([&] { mgr.Resume("flow-1", "tenant-a"); }));
  assert(mgr.Pause("flow-1", "tenant-a", "maintenance").status == "paused");
  assert(mgr.Resume("flow-1", "tenant-a").status == "running");
  assert(mgr.Cancel("flow-1", "tenant-a").status == "cancelled");
  assert(Throws<util::InvalidTransitionError>([&] { mgr.Cancel("flow-1", "tenant-a"); }));
  assert(Throws<util::InvalidTransitionError>([&] { mgr.Pause("flow-1", "tenant-a"); }));

  // a paused flow is a recovery candidate
  mgr.Create("flow-2", "tenant-a", state::MakeEmptyList());
  mgr.Pause("flow-2", "tenant-a");
  assert(mgr.Recover("flow-2", "tenant-a").outcome != RecoveryOutcome::kNoRecoveryNeeded);
  assert(mgr.Get("flow-2", "tenant-a")->status == "running");
}

void TestExportImport() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());
  mgr.Update("flow-1", "tenant-a", Fields({{"api_keys", state::MakeString(kSecret)}, {"notes", state::MakeString("keep")}}));
  mgr.TransitionPhase("flow-1", "tenant-a", "data_import");

  const auto sealed = mgr.Export("flow-1", "tenant-a", SERIALIZATION_FORMAT_JSON);
  assert(sealed.front() == '{');
  assert(sealed.find(kSecret) == std::string::npos);
  assert(sealed.find("\"export_format\": \"json\"") != std::string::npos || sealed.find("\"export_format\":\"json\"") != std::string::npos);

  const auto open = mgr.Export("flow-1", "tenant-a", SERIALIZATION_FORMAT_JSON, true);
  assert(open.find(kSecret) != std::string::npos);

  auto imported = mgr.Import("flow-copy", "tenant-b", sealed, SERIALIZATION_FORMAT_JSON);
  assert(imported.version == 1);
  assert(imported.phase == "data_import");
  assert(state::GetString(imported.state, keys::kFlowId) == "flow-copy");
  assert(state::GetString(imported.state, keys::kTenantId) == "tenant-b");
  assert(state::GetString(imported.state, "api_keys") == kSecret);
  assert(state::GetString(imported.state, "notes") == "keep");
  assert(LastLog(imported.state).fields().at("event").string_value() == "imported");
  assert(LastLog(imported.state).fields().at("source_flow_id").string_value() == "flow-1");

  assert(Throws<util::AlreadyExistsError>([&] { mgr.Import("flow-copy", "tenant-b", sealed, SERIALIZATION_FORMAT_JSON); }));

  const auto binary = mgr.Export("flow-1", "tenant-a", SERIALIZATION_FORMAT_BINARY);
  auto       again  = mgr.Import("flow-bin", "tenant-a", binary, SERIALIZATION_FORMAT_BINARY);
  assert(state::GetString(again.state, "api_keys") == kSecret);

  assert(Throws<util::SerializationError>([&] { mgr.Import("flow-bad", "tenant-a", "{ not json", SERIALIZATION_FORMAT_JSON); }));
  assert(!mgr.Get("flow-bad", "tenant-a").has_value());
}

void TestImportRefusesOversizedGzip() {
  // 1 KiB limit: at most 32 KiB may be inflated
  auto  rt  = MakeRuntime(1024);
  auto& mgr = *rt.manager;

  std::string doc = "{\"flow_id\":\"huge\",\"padding\":\"";
  doc.append(4 * 1024 * 1024, 'z');
  doc.append("\"}");
  const auto packed = flowstate::codec::GzipCompress(doc);
  assert(packed.size() < 64 * 1024);

  assert(Throws<util::SerializationError>([&] { mgr.Import("flow-huge", "tenant-a", packed, SERIALIZATION_FORMAT_JSON); }));
  assert(!mgr.Get("flow-huge", "tenant-a").has_value());
}

void TestAnalyticsAndCleanup() {
  auto  rt  = MakeRuntime();
  auto& mgr = *rt.manager;
  mgr.Create("flow-1", "tenant-a", state::MakeEmptyList());
  mgr.TransitionPhase("flow-1", "tenant-a", "data_import");
  mgr.CompletePhase("flow-1", "tenant-a", "data_import", Struct{});
  mgr.AddWarning("flow-1", "tenant-a", "data_import", "12 rows skipped");
  mgr.AddWarning("flow-1", "tenant-a", "data_import", "encoding guessed");

  auto stats = mgr.Analytics("flow-1", "tenant-a");
  assert(stats.version == 5);
  assert(stats.version_count == 5);
  assert(stats.checkpoint_count == 2);
  assert(stats.archived_count == 0);
  assert(stats.warning_count == 2);
  assert(stats.error_count == 0);
  assert(stats.completed_phases == 1);
  assert(stats.progress == 15);
  assert(stats.phase == "data_import");
  assert(stats.log_entries >= 3);

  auto report = mgr.Cleanup("flow-1", "tenant-a");
  assert(!report.checkpoint_id.empty());
  assert(report.versions_removed == 2);
  assert(rt.store->GetVersions("flow-1", "tenant-a").size() == 3);
  assert(rt.store->ListCheckpoints("flow-1", "tenant-a").back().checkpoint_id == report.checkpoint_id);

  assert(Throws<util::NotFoundError>([&] { mgr.Analytics("ghost", "tenant-a"); }));
}

} // namespace

int main() {
  const std::string key(flowstate::codec::StateEncryption::kKeySize, 'm');
  setenv("FLOWSTATE_ENCRYPTION_KEY", flowstate::codec::Base64Encode(key).c_str(), 1);

  TestCreate();
  TestUpdateRejectsProtectedKeys();
  TestTransitionGraph();
  TestTerminalFlowsNeedForceToMove();
  TestRejectedTransitionLeavesNoCheckpoint();
  TestCompletePhaseRecordsResults();
  TestHandleErrorRecovers();
  TestPauseResumeCancel();
  TestExportImport();
  TestImportRefusesOversizedGzip();
  TestAnalyticsAndCleanup();

  std::cout << "flowstate_unit_flow_state_manager: pass\n";
  return 0;
}
