#include "internal/core/flow_state_manager.hpp"

#include <algorithm>
#include <array>

#include "internal/codec/compression.hpp"
#include "internal/model/flow_phase.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_validator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowstate::core {

using flowstate::observability::BoolField;
using flowstate::observability::IntField;
using flowstate::observability::StringField;
using flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
using flowstate::runtime::config::SerializationFormat;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace keys = flowstate::state::keys;

namespace {

constexpr std::array<std::string_view, 4> kProtectedKeys = {keys::kFlowId, keys::kTenantId, keys::kCreatedAt, keys::kUpdatedAt};

constexpr std::string_view kExportStateKey  = "state";
constexpr std::string_view kExportFormatKey = "export_format";

std::string FlowLabel(const std::string& flow_id, const std::string& tenant_id) {
  return "flow " + flow_id + " (tenant " + tenant_id + ")";
}

model::Phase ParsePhaseOrThrow(const std::string& name) {
  auto phase = model::ParsePhase(name);
  if (!phase) {
    throw util::ValidationError("unknown phase: " + name, {"invalid phase: " + name});
  }
  return *phase;
}

model::Status CurrentStatus(const state::State& doc) {
  auto status = model::ParseStatus(state::GetString(doc, keys::kStatus));
  if (!status) {
    throw util::ValidationError("flow has unknown status: " + state::GetString(doc, keys::kStatus));
  }
  return *status;
}

state::State ParseDocument(const std::string& bytes, SerializationFormat format, std::uint64_t max_bytes) {
  std::string plain = bytes;
  if (codec::LooksLikeGzip(bytes)) {
    auto inflated = codec::GzipDecompress(bytes, max_bytes);
    if (!inflated) {
      throw util::SerializationError("import payload has a gzip header but does not decompress");
    }
    plain = std::move(*inflated);
  }

  if (format == SERIALIZATION_FORMAT_BINARY) {
    state::State doc;
    if (!doc.ParseFromString(plain)) {
      throw util::SerializationError("import payload is not a protobuf binary state");
    }
    return doc;
  }
  return state::FromJson(plain);
}

} // namespace

FlowStateManager::FlowStateManager(std::shared_ptr<store::FlowStateStore> store, std::shared_ptr<recovery::RecoveryEngine> recovery,
                                   std::shared_ptr<FlowCleanup> cleanup)
    : store_(std::move(store)), recovery_(std::move(recovery)), cleanup_(std::move(cleanup)) {
  if (!store_ || !recovery_ || !cleanup_) {
    throw std::invalid_argument("FlowStateManager requires store, recovery and cleanup");
  }
}

VersionedState FlowStateManager::LoadOrThrow(const std::string& flow_id, const std::string& tenant_id) {
  auto loaded = store_->Load(flow_id, tenant_id);
  if (!loaded) {
    throw util::NotFoundError(FlowLabel(flow_id, tenant_id) + " not found");
  }
  return std::move(*loaded);
}

VersionedState FlowStateManager::Persist(const std::string& flow_id, const std::string& tenant_id, state::State doc, uint64_t expected_version,
                                         const store::PriorCheckpoint* checkpoint) {
  const auto phase = state::GetString(doc, keys::kCurrentPhase);
  const auto saved = checkpoint ? store_->Save(flow_id, tenant_id, doc, phase, expected_version, *checkpoint)
                                : store_->Save(flow_id, tenant_id, doc, phase, expected_version);
  state::SetString(&doc, keys::kUpdatedAt, saved.timestamp);

  VersionedState out;
  out.status        = state::GetString(doc, keys::kStatus);
  out.state         = std::move(doc);
  out.version       = saved.version;
  out.phase         = phase;
  out.updated_at_ms = saved.updated_at_ms;
  return out;
}

VersionedState FlowStateManager::Mutate(const std::string& flow_id, const std::string& tenant_id, std::optional<uint64_t> expected_version,
                                        const Mutation& mutation) {
  auto current = LoadOrThrow(flow_id, tenant_id);
  if (expected_version && *expected_version != current.version) {
    throw util::ConcurrentModificationError(FlowLabel(flow_id, tenant_id) + " is at version " + std::to_string(current.version) + ", expected " +
                                                std::to_string(*expected_version),
                                            *expected_version, current.version);
  }
  mutation(current.state);
  return Persist(flow_id, tenant_id, std::move(current.state), current.version);
}

VersionedState FlowStateManager::Create(const std::string& flow_id, const std::string& tenant_id, Value raw_data, const Struct& extra_fields) {
  auto doc = state::NewInitialState(flow_id, tenant_id, std::move(raw_data));
  for (const auto& [key, value] : extra_fields.fields()) {
    if (std::find(kProtectedKeys.begin(), kProtectedKeys.end(), key) != kProtectedKeys.end()) {
      continue;
    }
    state::Set(&doc, key, value);
  }

  try {
    auto created = Persist(flow_id, tenant_id, std::move(doc), 0);
    FLOWSTATE_LOG_INFO("Created flow", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id)});
    return created;
  } catch (const util::ConcurrentModificationError&) {
    throw util::AlreadyExistsError(FlowLabel(flow_id, tenant_id) + " already exists");
  }
}

std::optional<VersionedState> FlowStateManager::Get(const std::string& flow_id, const std::string& tenant_id) {
  return store_->Load(flow_id, tenant_id);
}

VersionedState FlowStateManager::Update(const std::string& flow_id, const std::string& tenant_id, const Struct& updates,
                                        std::optional<uint64_t> expected_version) {
  std::vector<std::string> rejected;
  for (const auto& [key, value] : updates.fields()) {
    if (std::find(kProtectedKeys.begin(), kProtectedKeys.end(), key) != kProtectedKeys.end()) {
      rejected.push_back(key + " may not be overwritten");
    }
  }
  if (!rejected.empty()) {
    throw util::ValidationError("update of " + FlowLabel(flow_id, tenant_id) + " touches protected fields", rejected);
  }

  return Mutate(flow_id, tenant_id, expected_version, [&](state::State& doc) {
    for (const auto& [key, value] : updates.fields()) {
      state::Set(&doc, key, value);
    }
  });
}

VersionedState FlowStateManager::TransitionPhase(const std::string& flow_id, const std::string& tenant_id, const std::string& target_phase, bool force,
                                                 std::optional<uint64_t> expected_version) {
  observability::SpanScope span("flowstate.manager.transition_phase");
  span.SetAttribute("flow_id", flow_id);
  span.SetAttribute("target_phase", target_phase);

  const auto target  = ParsePhaseOrThrow(target_phase);
  auto       current = LoadOrThrow(flow_id, tenant_id);
  if (expected_version && *expected_version != current.version) {
    throw util::ConcurrentModificationError(FlowLabel(flow_id, tenant_id) + " is at version " + std::to_string(current.version) + ", expected " +
                                                std::to_string(*expected_version),
                                            *expected_version, current.version);
  }

  const auto from = state::GetString(current.state, keys::kCurrentPhase);
  if (!force) {
    const auto status = CurrentStatus(current.state);
    if (status == model::Status::kCompleted || status == model::Status::kCancelled || status == model::Status::kFailed) {
      throw util::InvalidTransitionError("cannot move " + FlowLabel(flow_id, tenant_id) + " to " + target_phase + " in status " +
                                         std::string(model::ToString(status)) + " without force");
    }
  }
  if (!force && !state::StateValidator::ValidatePhaseTransition(current.state, target_phase)) {
    throw util::InvalidTransitionError("transition of " + FlowLabel(flow_id, tenant_id) + " from " + from + " to " + target_phase +
                                       " is not allowed");
  }

  const store::PriorCheckpoint checkpoint{util::NewId(), from};

  auto& doc = current.state;
  state::SetString(&doc, keys::kCurrentPhase, model::ToString(target));
  state::SetNumber(&doc, keys::kProgress, model::ProgressFor(target));
  if (target == model::Phase::kCompleted) {
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kCompleted));
    state::SetString(&doc, keys::kCompletedAt, util::NowRfc3339());
  } else {
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kRunning));
    state::Erase(&doc, keys::kCompletedAt);
  }
  state::AppendLog(&doc, "phase_transition", "Phase changed from " + from + " to " + target_phase, target_phase,
                   {{"from_phase", state::MakeString(from)}, {"forced", state::MakeBool(force)}, {"checkpoint_id", state::MakeString(checkpoint.checkpoint_id)}});

  auto out = Persist(flow_id, tenant_id, std::move(doc), current.version, &checkpoint);
  FLOWSTATE_LOG_INFO("Phase transition", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id), StringField("from", from),
                                          StringField("to", target_phase), BoolField("forced", force),
                                          IntField("version", static_cast<int64_t>(out.version))});
  return out;
}

VersionedState FlowStateManager::CompletePhase(const std::string& flow_id, const std::string& tenant_id, const std::string& phase,
                                               const Struct& results) {
  ParsePhaseOrThrow(phase);

  auto out = Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) {
    state::MarkPhaseComplete(&doc, phase);
    auto* phase_results = state::FindMutable(&doc, keys::kPhaseResults);
    if (!phase_results || phase_results->kind_case() != Value::kStructValue) {
      state::Set(&doc, keys::kPhaseResults, state::MakeEmptyStruct());
      phase_results = state::FindMutable(&doc, keys::kPhaseResults);
    }
    *(*phase_results->mutable_struct_value()->mutable_fields())[phase].mutable_struct_value() = results;
    state::AppendLog(&doc, "phase_completed", "Phase " + phase + " completed", phase);
  });

  store_->CreateCheckpoint(flow_id, tenant_id, phase);
  return out;
}

recovery::RecoveryResult FlowStateManager::HandleError(const std::string& flow_id, const std::string& tenant_id, const std::string& phase,
                                                       const std::string& message, const Struct& details) {
  Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) {
    state::AddError(&doc, phase, message, details);
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kFailed));
    state::Erase(&doc, keys::kCompletedAt);
    state::AppendLog(&doc, "error", message, phase);
  });
  FLOWSTATE_LOG_WARN("Flow error recorded", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id), StringField("phase", phase),
                                             StringField("error", message)});

  return recovery_->Recover(flow_id, tenant_id);
}

VersionedState FlowStateManager::AddWarning(const std::string& flow_id, const std::string& tenant_id, const std::string& phase,
                                            const std::string& message) {
  return Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) { state::AddWarning(&doc, phase, message); });
}

VersionedState FlowStateManager::Pause(const std::string& flow_id, const std::string& tenant_id, const std::string& reason) {
  return Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) {
    const auto status = CurrentStatus(doc);
    if (status == model::Status::kCompleted || status == model::Status::kCancelled || status == model::Status::kFailed) {
      throw util::InvalidTransitionError("cannot pause " + FlowLabel(flow_id, tenant_id) + " in status " + std::string(model::ToString(status)));
    }
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kPaused));
    state::AppendLog(&doc, "paused", reason.empty() ? "Flow paused" : reason, state::GetString(doc, keys::kCurrentPhase));
  });
}

VersionedState FlowStateManager::Resume(const std::string& flow_id, const std::string& tenant_id) {
  return Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) {
    const auto status = CurrentStatus(doc);
    if (status != model::Status::kPaused) {
      throw util::InvalidTransitionError("cannot resume " + FlowLabel(flow_id, tenant_id) + " in status " + std::string(model::ToString(status)));
    }
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kRunning));
    state::AppendLog(&doc, "resumed", "Flow resumed", state::GetString(doc, keys::kCurrentPhase));
  });
}

VersionedState FlowStateManager::Cancel(const std::string& flow_id, const std::string& tenant_id, const std::string& reason) {
  return Mutate(flow_id, tenant_id, std::nullopt, [&](state::State& doc) {
    const auto status = CurrentStatus(doc);
    if (status == model::Status::kCompleted || status == model::Status::kCancelled) {
      throw util::InvalidTransitionError("cannot cancel " + FlowLabel(flow_id, tenant_id) + " in status " + std::string(model::ToString(status)));
    }
    state::SetString(&doc, keys::kStatus, model::ToString(model::Status::kCancelled));
    state::AppendLog(&doc, "cancelled", reason.empty() ? "Flow cancelled" : reason, state::GetString(doc, keys::kCurrentPhase));
  });
}

recovery::RecoveryResult FlowStateManager::Recover(const std::string& flow_id, const std::string& tenant_id) {
  return recovery_->Recover(flow_id, tenant_id);
}

CleanupReport FlowStateManager::Cleanup(const std::string& flow_id, const std::string& tenant_id) {
  return cleanup_->Cleanup(flow_id, tenant_id);
}

std::string FlowStateManager::Export(const std::string& flow_id, const std::string& tenant_id, SerializationFormat format, bool include_sensitive) {
  bool success = false;
  struct Record {
    bool& ok;
    ~Record() {
      observability::Metrics::Instance().RecordOperation("export", ok);
    }
  } record{success};

  const auto& codec   = store_->Codec();
  auto        current = LoadOrThrow(flow_id, tenant_id);

  Struct wrapper;
  state::SetString(&wrapper, keys::kFlowId, flow_id);
  state::SetString(&wrapper, keys::kTenantId, tenant_id);
  state::SetString(&wrapper, "export_timestamp", util::NowRfc3339());
  state::SetString(&wrapper, kExportFormatKey, codec::ToString(format));
  state::Set(&wrapper, "include_sensitive", state::MakeBool(include_sensitive));
  *(*wrapper.mutable_fields())[std::string(kExportStateKey)].mutable_struct_value() =
      include_sensitive ? codec.DecryptSensitiveFields(current.state) : codec.EncryptSensitiveFields(current.state);

  codec::EncodeOptions options;
  options.format            = format == SERIALIZATION_FORMAT_BINARY ? SERIALIZATION_FORMAT_BINARY : flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;
  options.compress          = false;
  options.include_metadata  = false;
  options.encrypt_sensitive = false;
  auto bytes                = codec.Encode(wrapper, options);

  FLOWSTATE_LOG_INFO("Exported flow state", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                             StringField("format", codec::ToString(format)), BoolField("include_sensitive", include_sensitive),
                                             IntField("size_bytes", static_cast<int64_t>(bytes.size()))});
  success = true;
  return bytes;
}

VersionedState FlowStateManager::Import(const std::string& flow_id, const std::string& tenant_id, const std::string& bytes, SerializationFormat format) {
  bool success = false;
  struct Record {
    bool& ok;
    ~Record() {
      observability::Metrics::Instance().RecordOperation("import", ok);
    }
  } record{success};

  auto doc = ParseDocument(bytes, format, store_->Codec().Options().MaxInflatedBytes());
  std::string source_flow = state::GetString(doc, keys::kFlowId);
  if (const auto* nested = state::Find(doc, kExportStateKey); nested && nested->kind_case() == Value::kStructValue && state::Has(doc, kExportFormatKey)) {
    doc = nested->struct_value();
  }

  state::Erase(&doc, codec::kMetadataKey);
  doc = store_->Codec().DecryptSensitiveFields(doc);

  const auto now = util::NowRfc3339();
  state::SetString(&doc, keys::kFlowId, flow_id);
  state::SetString(&doc, keys::kTenantId, tenant_id);
  state::SetString(&doc, keys::kCreatedAt, now);
  state::SetString(&doc, keys::kUpdatedAt, now);
  if (state::GetString(doc, keys::kStatus) == model::ToString(model::Status::kCompleted)) {
    state::SetString(&doc, keys::kCompletedAt, now);
  } else {
    state::Erase(&doc, keys::kCompletedAt);
  }
  state::EnsureCollections(&doc);
  state::AppendLog(&doc, "imported", "Flow state imported", state::GetString(doc, keys::kCurrentPhase),
                   {{"source_flow_id", state::MakeString(source_flow)}});

  state::StateValidator::ThrowIfInvalid(state::StateValidator::Validate(doc), "import into " + FlowLabel(flow_id, tenant_id));

  try {
    auto out = Persist(flow_id, tenant_id, std::move(doc), 0);
    FLOWSTATE_LOG_INFO("Imported flow state", {StringField("flow_id", flow_id), StringField("tenant_id", tenant_id),
                                               StringField("source_flow_id", source_flow)});
    success = true;
    return out;
  } catch (const util::ConcurrentModificationError&) {
    throw util::AlreadyExistsError(FlowLabel(flow_id, tenant_id) + " already exists");
  }
}

FlowAnalytics FlowStateManager::Analytics(const std::string& flow_id, const std::string& tenant_id) {
  auto current = LoadOrThrow(flow_id, tenant_id);

  FlowAnalytics out;
  out.version          = current.version;
  out.phase            = current.phase;
  out.status           = current.status;
  out.version_count    = store_->GetVersions(flow_id, tenant_id).size();
  out.checkpoint_count = store_->ListCheckpoints(flow_id, tenant_id).size();
  out.archived_count   = store_->ListArchivedSnapshots(flow_id, tenant_id).size();
  out.error_count      = state::ListSize(current.state, keys::kErrors);
  out.warning_count    = state::ListSize(current.state, keys::kWarnings);
  out.log_entries      = state::ListSize(current.state, keys::kWorkflowLog);
  out.progress         = state::GetNumber(current.state, keys::kProgress).value_or(0);

  if (const auto* completion = state::Find(current.state, keys::kPhaseCompletion); completion && completion->kind_case() == Value::kStructValue) {
    for (const auto& [name, done] : completion->struct_value().fields()) {
      if (done.kind_case() == Value::kBoolValue && done.bool_value()) {
        ++out.completed_phases;
      }
    }
  }
  return out;
}

} // namespace flowstate::core
