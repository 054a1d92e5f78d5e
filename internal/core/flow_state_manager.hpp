#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/core/flow_cleanup.hpp"
#include "internal/recovery/recovery_engine.hpp"
#include "internal/store/flow_state_store.hpp"

namespace flowstate::core {

using store::VersionedState;

struct FlowAnalytics {
  std::size_t version_count    = 0;
  std::size_t checkpoint_count = 0;
  std::size_t archived_count   = 0;
  std::size_t error_count      = 0;
  std::size_t warning_count    = 0;
  std::size_t log_entries      = 0;
  std::size_t completed_phases = 0;
  double      progress         = 0;
  uint64_t    version          = 0;
  std::string phase;
  std::string status;
};

/*
  Lifecycle operations over one flow at a time.

  Every mutation is read-modify-write against the version it read, so a
  concurrent writer surfaces as ConcurrentModificationError rather than a
  lost update. Callers that pass expected_version get the same check
  against their own view.
*/
class FlowStateManager {
 public:
  FlowStateManager(std::shared_ptr<store::FlowStateStore> store, std::shared_ptr<recovery::RecoveryEngine> recovery,
                   std::shared_ptr<FlowCleanup> cleanup);

  // AlreadyExistsError when the flow exists.
  VersionedState Create(const std::string& flow_id, const std::string& tenant_id, google::protobuf::Value raw_data,
                        const google::protobuf::Struct& extra_fields = {});

  std::optional<VersionedState> Get(const std::string& flow_id, const std::string& tenant_id);

  // Top-level merge. Identity and timestamp bookkeeping keys are rejected.
  VersionedState Update(const std::string& flow_id, const std::string& tenant_id, const google::protobuf::Struct& updates,
                        std::optional<uint64_t> expected_version = std::nullopt);

  // Moves to target and checkpoints the prior state in the same commit.
  // Without force only the next phase in the chain is accepted, and flows
  // that are completed, cancelled or failed are rejected.
  VersionedState TransitionPhase(const std::string& flow_id, const std::string& tenant_id, const std::string& target_phase, bool force = false,
                                 std::optional<uint64_t> expected_version = std::nullopt);

  VersionedState CompletePhase(const std::string& flow_id, const std::string& tenant_id, const std::string& phase,
                               const google::protobuf::Struct& results);

  // Records the error, marks the flow failed, then runs recovery.
  recovery::RecoveryResult HandleError(const std::string& flow_id, const std::string& tenant_id, const std::string& phase,
                                       const std::string& message, const google::protobuf::Struct& details = {});

  VersionedState AddWarning(const std::string& flow_id, const std::string& tenant_id, const std::string& phase, const std::string& message);

  VersionedState Pause(const std::string& flow_id, const std::string& tenant_id, const std::string& reason = {});
  VersionedState Resume(const std::string& flow_id, const std::string& tenant_id);
  VersionedState Cancel(const std::string& flow_id, const std::string& tenant_id, const std::string& reason = {});

  recovery::RecoveryResult Recover(const std::string& flow_id, const std::string& tenant_id);

  CleanupReport Cleanup(const std::string& flow_id, const std::string& tenant_id);

  std::string Export(const std::string& flow_id, const std::string& tenant_id, flowstate::runtime::config::SerializationFormat format,
                     bool include_sensitive = false);

  // Accepts an export wrapper or a bare state and creates a new flow
  // under the target identity.
  VersionedState Import(const std::string& flow_id, const std::string& tenant_id, const std::string& bytes,
                        flowstate::runtime::config::SerializationFormat format);

  FlowAnalytics Analytics(const std::string& flow_id, const std::string& tenant_id);

  store::FlowStateStore& Store() {
    return *store_;
  }

 private:
  using Mutation = std::function<void(state::State&)>;

  VersionedState LoadOrThrow(const std::string& flow_id, const std::string& tenant_id);
  VersionedState Mutate(const std::string& flow_id, const std::string& tenant_id, std::optional<uint64_t> expected_version,
                        const Mutation& mutation);
  VersionedState Persist(const std::string& flow_id, const std::string& tenant_id, state::State doc, uint64_t expected_version,
                         const store::PriorCheckpoint* checkpoint = nullptr);

  std::shared_ptr<store::FlowStateStore>     store_;
  std::shared_ptr<recovery::RecoveryEngine> recovery_;
  std::shared_ptr<FlowCleanup>               cleanup_;
};

} // namespace flowstate::core
