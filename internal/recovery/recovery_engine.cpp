#include "internal/recovery/recovery_engine.hpp"

#include <cmath>
#include <optional>

#include "config/config.pb.h"
#include "internal/model/flow_phase.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstate::recovery {

using flowstate::observability::IntField;
using flowstate::observability::StringField;
using google::protobuf::Value;

namespace keys = flowstate::state::keys;

RecoveryOptions RecoveryOptions::FromConfig(const flowstate::runtime::config::RuntimeConfig& config) {
  RecoveryOptions options;
  if (config.recovery().unrepairable_policy() == flowstate::runtime::config::UNREPAIRABLE_POLICY_ESCALATE) {
    options.unrepairable_policy = UnrepairablePolicy::kEscalate;
  }
  return options;
}

RecoveryEngine::RecoveryEngine(std::shared_ptr<store::FlowStateStore> store, RecoveryOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("RecoveryEngine requires a store");
  }
}

state::State RecoveryEngine::Repair(const state::State& input, const std::string& flow_id, const std::string& tenant_id,
                                    std::vector<std::string>* actions) {
  state::State out = input;
  auto         note = [actions](std::string action) {
    if (actions) {
      actions->push_back(std::move(action));
    }
  };

  for (auto key : {keys::kFlowId, keys::kTenantId}) {
    const auto& expected = key == keys::kFlowId ? flow_id : tenant_id;
    if (state::GetString(out, key) != expected) {
      state::SetString(&out, key, expected);
      note("restored " + std::string(key) + " from record key");
    }
  }

  for (auto key : {keys::kErrors, keys::kWarnings, keys::kWorkflowLog}) {
    const auto* value = state::Find(out, key);
    if (!value || value->kind_case() != Value::kListValue) {
      state::Set(&out, key, state::MakeEmptyList());
      note("reset " + std::string(key) + " to empty list");
    }
  }
  for (auto key : {keys::kPhaseCompletion, keys::kPhaseResults}) {
    const auto* value = state::Find(out, key);
    if (!value || value->kind_case() != Value::kStructValue) {
      state::Set(&out, key, state::MakeEmptyStruct());
      note("reset " + std::string(key) + " to empty mapping");
    }
  }

  auto* completion = state::FindMutable(&out, keys::kPhaseCompletion)->mutable_struct_value()->mutable_fields();
  for (auto it = completion->begin(); it != completion->end();) {
    if (it->second.kind_case() != Value::kBoolValue) {
      note("dropped non-boolean phase_completion." + it->first);
      it = completion->erase(it);
    } else {
      ++it;
    }
  }

  if (!model::ParsePhase(state::GetString(out, keys::kCurrentPhase))) {
    state::SetString(&out, keys::kCurrentPhase, model::ToString(model::Phase::kInitialization));
    note("set current_phase to initialization");
  }

  if (state::GetString(out, keys::kStatus) != model::ToString(model::Status::kRunning)) {
    state::SetString(&out, keys::kStatus, model::ToString(model::Status::kRunning));
    note("set status to running");
  }

  const auto progress = state::GetNumber(out, keys::kProgress);
  if (!progress || !std::isfinite(*progress) || *progress < 0 || *progress > 100) {
    state::SetNumber(&out, keys::kProgress, 0);
    note("set progress_percentage to 0");
  }

  const auto now = util::NowRfc3339();
  for (auto key : {keys::kCreatedAt, keys::kUpdatedAt}) {
    const auto* value = state::Find(out, key);
    if (!value || value->kind_case() != Value::kStringValue || !util::ParseRfc3339(value->string_value())) {
      state::SetString(&out, key, now);
      note("reset " + std::string(key) + " to now");
    }
  }
  if (*util::ParseRfc3339(state::GetString(out, keys::kUpdatedAt)) < *util::ParseRfc3339(state::GetString(out, keys::kCreatedAt))) {
    state::SetString(&out, keys::kUpdatedAt, state::GetString(out, keys::kCreatedAt));
    note("moved updated_at to created_at");
  }

  // A running flow carries no completion time.
  if (const auto* completed_at = state::Find(out, keys::kCompletedAt); completed_at && completed_at->kind_case() != Value::kNullValue) {
    state::Erase(&out, keys::kCompletedAt);
    note("cleared completed_at");
  }

  return out;
}

uint64_t RecoveryEngine::Persist(const std::string& flow_id, const std::string& tenant_id, const state::State& doc, uint64_t expected_version,
                                 std::string_view step) {
  try {
    return store_->Save(flow_id, tenant_id, doc, state::GetString(doc, keys::kCurrentPhase), expected_version).version;
  } catch (const util::ConcurrentModificationError&) {
    throw;
  } catch (const util::FlowStateError& ex) {
    throw util::StateRecoveryError("recovery " + std::string(step) + " of flow " + flow_id + " could not be persisted: " + ex.what());
  }
}

RecoveryResult RecoveryEngine::Recover(const std::string& flow_id, const std::string& tenant_id) {
  observability::SpanScope span("flowstate.recovery.recover");
  span.SetAttribute("flow_id", flow_id);
  span.SetAttribute("tenant_id", tenant_id);

  auto record = store_->LoadRaw(flow_id, tenant_id);
  if (!record) {
    throw util::NotFoundError("cannot recover missing flow " + flow_id + " (tenant " + tenant_id + ")");
  }

  std::optional<state::State> decoded;
  std::string                 decode_error;
  try {
    decoded = store_->Codec().Decode(record->state_blob);
  } catch (const util::FlowStateError& ex) {
    decode_error = ex.what();
    FLOWSTATE_LOG_WARN("Flow state blob does not decode", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                            StringField("error", decode_error)});
  }

  RecoveryResult result;
  auto           finish = [&](RecoveryOutcome outcome) {
    result.outcome = outcome;
    observability::Metrics::Instance().RecordRecoveryOutcome(ToString(outcome));
    span.SetAttribute("outcome", ToString(outcome));
    return result;
  };

  const auto status = decoded ? state::GetString(*decoded, keys::kStatus) : record->status;
  if (!model::NeedsRecovery(status)) {
    result.version = record->version;
    result.detail  = "status " + status + " does not require recovery";
    return finish(RecoveryOutcome::kNoRecoveryNeeded);
  }

  FLOWSTATE_LOG_INFO("Starting flow recovery", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                StringField("status", status), IntField("version", static_cast<int64_t>(record->version))});

  const auto checkpoints = store_->ListCheckpoints(flow_id, tenant_id);
  for (auto it = checkpoints.rbegin(); it != checkpoints.rend(); ++it) {
    if (!it->decodable) {
      result.actions.push_back("skipped undecodable checkpoint " + it->checkpoint_id);
      continue;
    }
    const auto validation = state::StateValidator::Validate(it->snapshot);
    if (!validation.valid) {
      result.actions.push_back("skipped invalid checkpoint " + it->checkpoint_id);
      continue;
    }

    state::State restored = it->snapshot;
    state::SetString(&restored, keys::kFlowId, flow_id);
    state::SetString(&restored, keys::kTenantId, tenant_id);
    state::SetString(&restored, keys::kStatus, model::ToString(model::Status::kRunning));
    state::Erase(&restored, keys::kCompletedAt);
    state::AppendLog(&restored, "resumed", "Flow resumed from checkpoint", state::GetString(restored, keys::kCurrentPhase),
                     {{"checkpoint_id", state::MakeString(it->checkpoint_id)}, {"reason", state::MakeString("recovery from status " + status)}});

    result.checkpoint_id = it->checkpoint_id;
    result.version       = Persist(flow_id, tenant_id, restored, record->version, "restore");
    result.actions.push_back("restored checkpoint " + it->checkpoint_id);
    result.detail = "restored checkpoint taken at state version " + std::to_string(it->state_version);
    FLOWSTATE_LOG_INFO("Recovered flow from checkpoint", {StringField("flow_id", flow_id), StringField("checkpoint_id", it->checkpoint_id),
                                                          IntField("version", static_cast<int64_t>(result.version))});
    return finish(RecoveryOutcome::kRecoveredFromCheckpoint);
  }

  std::string unrepairable_reason;
  if (decoded) {
    auto repaired   = Repair(*decoded, flow_id, tenant_id, &result.actions);
    auto validation = state::StateValidator::Validate(repaired);
    if (validation.valid) {
      state::AppendLog(&repaired, "repaired", "Flow state repaired with safe defaults", state::GetString(repaired, keys::kCurrentPhase),
                       {{"reason", state::MakeString("recovery from status " + status)}});
      result.version = Persist(flow_id, tenant_id, repaired, record->version, "repair");
      result.detail  = "repaired current state in place";
      FLOWSTATE_LOG_INFO("Repaired flow state", {StringField("flow_id", flow_id), IntField("actions", static_cast<int64_t>(result.actions.size())),
                                                 IntField("version", static_cast<int64_t>(result.version))});
      return finish(RecoveryOutcome::kRepaired);
    }
    unrepairable_reason = "repair did not produce a valid state: " + validation.errors.front();
  } else {
    unrepairable_reason = "state blob does not decode: " + decode_error;
  }

  result.archive_id = store_->ArchiveSnapshot(flow_id, tenant_id, record->state_blob, record->version, "unrepairable: " + unrepairable_reason);
  result.actions.push_back("archived state version " + std::to_string(record->version));

  if (options_.unrepairable_policy == UnrepairablePolicy::kEscalate) {
    result.version = record->version;
    result.detail  = unrepairable_reason;
    FLOWSTATE_LOG_ERROR("Flow requires manual intervention", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                              StringField("archive_id", result.archive_id), StringField("reason", unrepairable_reason)});
    return finish(RecoveryOutcome::kManualInterventionRequired);
  }

  Value raw_data = state::MakeEmptyList();
  if (decoded) {
    if (const auto* existing = state::Find(*decoded, keys::kRawData)) {
      raw_data = *existing;
    }
  }
  auto fresh = state::NewInitialState(flow_id, tenant_id, std::move(raw_data));
  state::AppendLog(&fresh, "reset", "Flow state reset to initial after unrepairable corruption", model::ToString(model::Phase::kInitialization),
                   {{"archive_id", state::MakeString(result.archive_id)}, {"reason", state::MakeString(unrepairable_reason)}});

  result.version = Persist(flow_id, tenant_id, fresh, record->version, "reset");
  result.actions.push_back("reset to initial state");
  result.detail = unrepairable_reason;
  FLOWSTATE_LOG_ERROR("Flow state reset to initial", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                                      StringField("archive_id", result.archive_id), StringField("reason", unrepairable_reason)});
  return finish(RecoveryOutcome::kResetToInitial);
}

} // namespace flowstate::recovery
