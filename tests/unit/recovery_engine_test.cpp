#include "internal/recovery/recovery_engine.hpp"

#include <algorithm>
#include <cassert>
#include <limits>
#include <iostream>
#include <memory>
#include <string>

#include "flowstate/v1/flow_state.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstate::codec::CodecOptions;
using flowstate::codec::StateCodec;
using flowstate::codec::StateEncryption;
using flowstate::db::memory::MemoryRepository;
using flowstate::recovery::RecoveryEngine;
using flowstate::recovery::RecoveryOptions;
using flowstate::recovery::RecoveryOutcome;
using flowstate::recovery::UnrepairablePolicy;
using flowstate::store::FlowStateStore;
using flowstate::store::StoreOptions;

namespace keys  = flowstate::state::keys;
namespace state = flowstate::state;
namespace util  = flowstate::util;

struct Stack {
  std::shared_ptr<MemoryRepository> repository;
  std::shared_ptr<StateCodec>       codec;
  std::shared_ptr<FlowStateStore>   store;
  std::shared_ptr<RecoveryEngine>   recovery;
};

Stack MakeStack(UnrepairablePolicy policy = UnrepairablePolicy::kResetToInitial) {
  CodecOptions codec_options;
  codec_options.sensitive_fields = {"credentials"};

  Stack s;
  s.repository = std::make_shared<MemoryRepository>();
  s.codec      = std::make_shared<StateCodec>(codec_options, std::make_shared<StateEncryption>(std::string(StateEncryption::kKeySize, 'r')));
  s.store      = std::make_shared<FlowStateStore>(s.repository, s.codec, nullptr, StoreOptions{});

  RecoveryOptions options;
  options.unrepairable_policy = policy;
  s.recovery                  = std::make_shared<RecoveryEngine>(s.store, options);
  return s;
}

state::State Doc(int stage) {
  google::protobuf::Value raw = state::MakeEmptyList();
  *raw.mutable_list_value()->add_values() = state::MakeString("row-1");

  auto doc = state::NewInitialState("flow-1", "tenant-a", raw);
  state::SetString(&doc, keys::kStatus, "running");
  state::SetNumber(&doc, "stage", stage);
  return doc;
}

// Replaces the current blob without going through validation, as a crash
// or a buggy writer would.
uint64_t OverwriteBlob(MemoryRepository& repository, const std::string& blob, const std::string& status) {
  auto tx     = repository.Begin();
  auto record = repository.GetFlowState(*tx, "flow-1", "tenant-a");
  assert(record.has_value());

  const auto expected = record->version;
  record->version     = expected + 1;
  record->status      = status;
  record->state_blob  = blob;
  auto result         = repository.UpdateFlowState(*tx, *record, expected);
  assert(result);
  tx->Commit();
  return record->version;
}

void CorruptNewestCheckpoint(MemoryRepository& repository) {
  auto tx     = repository.Begin();
  auto record = repository.GetFlowState(*tx, "flow-1", "tenant-a");

  flowstate::v1::CheckpointRing ring;
  const bool                    parsed = ring.ParseFromString(record->checkpoints_blob);
  assert(parsed && ring.entries_size() > 0);
  ring.mutable_entries(ring.entries_size() - 1)->set_state_blob("not a state blob");
  auto result = repository.UpdateCheckpoints(*tx, "flow-1", "tenant-a", ring.SerializeAsString());
  assert(result);
  tx->Commit();
}

void SaveFailed(Stack& s, int stage) {
  auto doc = Doc(stage);
  state::SetString(&doc, keys::kStatus, "failed");
  s.store->Save("flow-1", "tenant-a", doc, "");
}

void TestHealthyFlowNeedsNoRecovery() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc(1), "");

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kNoRecoveryNeeded);
  assert(result.version == 1);
  assert(s.store->Load("flow-1", "tenant-a")->version == 1);
}

void TestNewestValidCheckpointWins() {
  auto s = MakeStack();

  std::string ids[3];
  for (int stage = 1; stage <= 3; ++stage) {
    s.store->Save("flow-1", "tenant-a", Doc(stage), "");
    ids[stage - 1] = s.store->CreateCheckpoint("flow-1", "tenant-a", "");
  }
  SaveFailed(s, 4);

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kRecoveredFromCheckpoint);
  assert(result.checkpoint_id == ids[2]);
  assert(result.version == 5);

  auto loaded = s.store->Load("flow-1", "tenant-a");
  assert(loaded->version == 5);
  assert(loaded->status == "running");
  assert(state::GetNumber(loaded->state, "stage") == 3);
  assert(state::StateValidator::Validate(loaded->state).valid);

  // checkpoints are read, never rewritten
  auto checkpoints = s.store->ListCheckpoints("flow-1", "tenant-a");
  assert(checkpoints.size() == 3);
  assert(checkpoints[2].checkpoint_id == ids[2]);
  assert(checkpoints[2].state_version == 3);
}

void TestUndecodableCheckpointIsSkipped() {
  auto s = MakeStack();

  std::string ids[2];
  for (int stage = 1; stage <= 2; ++stage) {
    s.store->Save("flow-1", "tenant-a", Doc(stage), "");
    ids[stage - 1] = s.store->CreateCheckpoint("flow-1", "tenant-a", "");
  }
  CorruptNewestCheckpoint(*s.repository);
  SaveFailed(s, 3);

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kRecoveredFromCheckpoint);
  assert(result.checkpoint_id == ids[0]);
  assert(std::any_of(result.actions.begin(), result.actions.end(),
                     [&](const std::string& a) { return a.find("skipped undecodable checkpoint " + ids[1]) != std::string::npos; }));
  assert(state::GetNumber(s.store->Load("flow-1", "tenant-a")->state, "stage") == 1);
}

void TestOutOfRangeProgressIsRepaired() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc(1), "");

  auto broken = Doc(1);
  state::SetString(&broken, keys::kStatus, "failed");
  state::SetNumber(&broken, keys::kProgress, 150);
  state::SetString(&broken, keys::kErrors, "oops");
  OverwriteBlob(*s.repository, s.codec->Encode(broken), "failed");

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kRepaired);
  assert(result.version == 3);
  assert(!result.actions.empty());

  auto loaded = s.store->Load("flow-1", "tenant-a");
  assert(state::GetNumber(loaded->state, keys::kProgress) == 0);
  assert(loaded->status == "running");
  assert(state::ListSize(loaded->state, keys::kErrors) == 0);
  assert(state::GetNumber(loaded->state, "stage") == 1);
  assert(s.store->ListArchivedSnapshots("flow-1", "tenant-a").empty());
}

void TestNonFiniteProgressIsRepaired() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc(1), "");

  // JSON can not carry NaN, so the broken state goes in as protobuf binary
  auto broken = Doc(1);
  state::SetString(&broken, keys::kStatus, "failed");
  state::SetNumber(&broken, keys::kProgress, std::numeric_limits<double>::quiet_NaN());
  flowstate::codec::EncodeOptions binary;
  binary.format = flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
  OverwriteBlob(*s.repository, s.codec->Encode(broken, binary), "failed");

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kRepaired);
  assert(std::any_of(result.actions.begin(), result.actions.end(),
                     [](const std::string& a) { return a.find("progress_percentage") != std::string::npos; }));
  assert(state::GetNumber(s.store->Load("flow-1", "tenant-a")->state, keys::kProgress) == 0);

  std::vector<std::string> actions;
  auto doc = state::NewInitialState("flow-7", "tenant-z", state::MakeEmptyList());
  state::SetNumber(&doc, keys::kProgress, -std::numeric_limits<double>::infinity());
  auto repaired = RecoveryEngine::Repair(doc, "flow-7", "tenant-z", &actions);
  assert(state::GetNumber(repaired, keys::kProgress) == 0);
  assert(state::StateValidator::Validate(repaired).valid);
}

void TestUndecodableBlobResetsToInitial() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc(1), "");
  const auto broken_version = OverwriteBlob(*s.repository, "not a state blob", "failed");

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kResetToInitial);
  assert(!result.archive_id.empty());
  assert(result.version == broken_version + 1);

  auto archives = s.store->ListArchivedSnapshots("flow-1", "tenant-a");
  assert(archives.size() == 1);
  assert(archives[0].archive_id == result.archive_id);
  assert(archives[0].version == broken_version);

  auto loaded = s.store->Load("flow-1", "tenant-a");
  assert(loaded->phase == "initialization");
  assert(loaded->status == "initialized");
  assert(state::GetNumber(loaded->state, keys::kProgress) == 0);
  assert(!state::Has(loaded->state, "stage"));

  const auto& log = state::Find(loaded->state, keys::kWorkflowLog)->list_value();
  const auto& last = log.values(log.values_size() - 1).struct_value().fields();
  assert(last.at("event").string_value() == "reset");
  assert(last.at("archive_id").string_value() == result.archive_id);
}

void TestEscalatePolicyLeavesTheFlowAlone() {
  auto s = MakeStack(UnrepairablePolicy::kEscalate);
  s.store->Save("flow-1", "tenant-a", Doc(1), "");
  const auto broken_version = OverwriteBlob(*s.repository, "not a state blob", "failed");

  auto result = s.recovery->Recover("flow-1", "tenant-a");
  assert(result.outcome == RecoveryOutcome::kManualInterventionRequired);
  assert(result.version == broken_version);
  assert(!result.archive_id.empty());

  auto raw = s.store->LoadRaw("flow-1", "tenant-a");
  assert(raw->version == broken_version);
  assert(raw->state_blob == "not a state blob");
  assert(s.store->ListArchivedSnapshots("flow-1", "tenant-a").size() == 1);
}

void TestMissingFlowIsNotFound() {
  auto s     = MakeStack();
  bool threw = false;
  try {
    s.recovery->Recover("ghost", "tenant-a");
  } catch (const util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void TestRepairFillsEveryMissingField() {
  state::State doc;
  state::SetString(&doc, keys::kCurrentPhase, "teleport");
  state::SetString(&doc, keys::kCreatedAt, "2024-05-02T10:00:00Z");
  state::SetString(&doc, keys::kUpdatedAt, "2024-05-01T10:00:00Z");
  state::SetString(&doc, keys::kCompletedAt, "2024-05-03T10:00:00Z");

  std::vector<std::string> actions;
  auto repaired = RecoveryEngine::Repair(doc, "flow-7", "tenant-z", &actions);

  assert(state::StateValidator::Validate(repaired).valid);
  assert(state::GetString(repaired, keys::kFlowId) == "flow-7");
  assert(state::GetString(repaired, keys::kTenantId) == "tenant-z");
  assert(state::GetString(repaired, keys::kCurrentPhase) == "initialization");
  assert(state::GetString(repaired, keys::kUpdatedAt) == "2024-05-02T10:00:00Z");
  assert(!state::Has(repaired, keys::kCompletedAt));
  assert(actions.size() >= 10);

  // already valid input only has its status reset
  actions.clear();
  auto clean = state::NewInitialState("flow-7", "tenant-z", state::MakeEmptyList());
  state::SetString(&clean, keys::kStatus, "running");
  auto same = RecoveryEngine::Repair(clean, "flow-7", "tenant-z", &actions);
  assert(actions.empty());
  assert(state::Equal(same, clean));
}

} // namespace

int main() {
  TestHealthyFlowNeedsNoRecovery();
  TestNewestValidCheckpointWins();
  TestUndecodableCheckpointIsSkipped();
  TestOutOfRangeProgressIsRepaired();
  TestNonFiniteProgressIsRepaired();
  TestUndecodableBlobResetsToInitial();
  TestEscalatePolicyLeavesTheFlowAlone();
  TestMissingFlowIsNotFound();
  TestRepairFillsEveryMissingField();

  std::cout << "flowstate_unit_recovery_engine: pass\n";
  return 0;
}
