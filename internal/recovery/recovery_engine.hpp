#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/state/flow_state.hpp"
#include "internal/store/flow_state_store.hpp"

namespace flowstate::runtime::config {
class RuntimeConfig;
}

namespace flowstate::recovery {

enum class RecoveryOutcome {
  kNoRecoveryNeeded,
  kRecoveredFromCheckpoint,
  kRepaired,
  kResetToInitial,
  kManualInterventionRequired,
};

constexpr std::string_view ToString(RecoveryOutcome outcome) {
  switch (outcome) {
    case RecoveryOutcome::kNoRecoveryNeeded:
      return "no_recovery_needed";
    case RecoveryOutcome::kRecoveredFromCheckpoint:
      return "recovered_from_checkpoint";
    case RecoveryOutcome::kRepaired:
      return "repaired";
    case RecoveryOutcome::kResetToInitial:
      return "reset_to_initial";
    case RecoveryOutcome::kManualInterventionRequired:
      return "manual_intervention_required";
  }
  return "unknown";
}

struct RecoveryResult {
  RecoveryOutcome          outcome = RecoveryOutcome::kNoRecoveryNeeded;
  std::string              checkpoint_id;
  std::string              archive_id;
  uint64_t                 version = 0;
  std::vector<std::string> actions;
  std::string              detail;
};

enum class UnrepairablePolicy {
  kResetToInitial,
  kEscalate,
};

struct RecoveryOptions {
  UnrepairablePolicy unrepairable_policy = UnrepairablePolicy::kResetToInitial;

  static RecoveryOptions FromConfig(const flowstate::runtime::config::RuntimeConfig& config);
};

/*
  Brings a failed or paused flow back to a valid running state.

  Order of attempts:
    1. newest checkpoint whose snapshot decodes and validates
    2. in-place repair of the current state
    3. unrepairable policy: archive the blob, then reset or escalate

  Checkpoints are never modified. Every write goes through the store with
  the version read at the start, so a concurrent writer wins and recovery
  surfaces ConcurrentModificationError.
*/
class RecoveryEngine {
 public:
  RecoveryEngine(std::shared_ptr<store::FlowStateStore> store, RecoveryOptions options);

  // NotFoundError when the flow does not exist; StateRecoveryError when a
  // restore, repair or reset cannot be persisted.
  RecoveryResult Recover(const std::string& flow_id, const std::string& tenant_id);

  // Fills or corrects every invalid field with a safe default. Appends a
  // description of each change to actions.
  static state::State Repair(const state::State& input, const std::string& flow_id, const std::string& tenant_id, std::vector<std::string>* actions);

 private:
  uint64_t Persist(const std::string& flow_id, const std::string& tenant_id, const state::State& doc, uint64_t expected_version,
                   std::string_view step);

  std::shared_ptr<store::FlowStateStore> store_;
  RecoveryOptions                        options_;
};

} // namespace flowstate::recovery
