#include "internal/state/flow_state.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/model/flow_phase.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstate::state {

using google::protobuf::ListValue;
using google::protobuf::NULL_VALUE;
using google::protobuf::Struct;
using google::protobuf::Value;

Value MakeString(std::string_view value) {
  Value out;
  out.set_string_value(std::string(value));
  return out;
}

Value MakeNumber(double value) {
  Value out;
  out.set_number_value(value);
  return out;
}

Value MakeBool(bool value) {
  Value out;
  out.set_bool_value(value);
  return out;
}

Value MakeNull() {
  Value out;
  out.set_null_value(NULL_VALUE);
  return out;
}

Value MakeEmptyList() {
  Value out;
  out.mutable_list_value();
  return out;
}

Value MakeEmptyStruct() {
  Value out;
  out.mutable_struct_value();
  return out;
}

const Value* Find(const State& state, std::string_view key) {
  const auto it = state.fields().find(std::string(key));
  return it == state.fields().end() ? nullptr : &it->second;
}

Value* FindMutable(State* state, std::string_view key) {
  auto* fields = state->mutable_fields();
  const auto it = fields->find(std::string(key));
  return it == fields->end() ? nullptr : &it->second;
}

bool Has(const State& state, std::string_view key) {
  return Find(state, key) != nullptr;
}

std::string GetString(const State& state, std::string_view key) {
  const auto* value = Find(state, key);
  if (!value || value->kind_case() != Value::kStringValue) {
    return {};
  }
  return value->string_value();
}

std::optional<double> GetNumber(const State& state, std::string_view key) {
  const auto* value = Find(state, key);
  if (!value || value->kind_case() != Value::kNumberValue) {
    return std::nullopt;
  }
  return value->number_value();
}

void Set(State* state, std::string_view key, Value value) {
  (*state->mutable_fields())[std::string(key)] = std::move(value);
}

void SetString(State* state, std::string_view key, std::string_view value) {
  Set(state, key, MakeString(value));
}

void SetNumber(State* state, std::string_view key, double value) {
  Set(state, key, MakeNumber(value));
}

void Erase(State* state, std::string_view key) {
  state->mutable_fields()->erase(std::string(key));
}

void EnsureCollections(State* state) {
  for (auto key : {keys::kPhaseCompletion, keys::kPhaseResults}) {
    if (!Has(*state, key)) {
      Set(state, key, MakeEmptyStruct());
    }
  }
  for (auto key : {keys::kErrors, keys::kWarnings, keys::kWorkflowLog}) {
    if (!Has(*state, key)) {
      Set(state, key, MakeEmptyList());
    }
  }
}

State NewInitialState(const std::string& flow_id, const std::string& tenant_id, Value raw_data) {
  State      state;
  const auto now = util::NowRfc3339();

  SetString(&state, keys::kFlowId, flow_id);
  SetString(&state, keys::kTenantId, tenant_id);
  SetString(&state, keys::kCurrentPhase, model::ToString(model::Phase::kInitialization));
  SetString(&state, keys::kStatus, model::ToString(model::Status::kInitialized));
  SetNumber(&state, keys::kProgress, 0);

  Value completion = MakeEmptyStruct();
  for (auto phase : model::kAllPhases) {
    if (!model::IsTerminal(phase)) {
      (*completion.mutable_struct_value()->mutable_fields())[std::string(model::ToString(phase))] = MakeBool(false);
    }
  }
  Set(&state, keys::kPhaseCompletion, std::move(completion));

  if (raw_data.kind_case() == Value::KIND_NOT_SET) {
    raw_data = MakeEmptyList();
  }
  Set(&state, keys::kRawData, std::move(raw_data));

  SetString(&state, keys::kCreatedAt, now);
  SetString(&state, keys::kUpdatedAt, now);
  EnsureCollections(&state);

  AppendLog(&state, "flow_created", "Flow state initialized", model::ToString(model::Phase::kInitialization));
  return state;
}

namespace {

ListValue* MutableList(State* state, std::string_view key) {
  auto* value = FindMutable(state, key);
  if (!value || value->kind_case() != Value::kListValue) {
    Set(state, key, MakeEmptyList());
    value = FindMutable(state, key);
  }
  return value->mutable_list_value();
}

} // namespace

void AppendLog(State* state, std::string_view event, std::string_view message, std::string_view phase,
               std::initializer_list<ExtraField> extra) {
  Value entry = MakeEmptyStruct();
  auto* fields = entry.mutable_struct_value()->mutable_fields();
  (*fields)["timestamp"] = MakeString(util::NowRfc3339());
  (*fields)["event"]     = MakeString(event);
  (*fields)["message"]   = MakeString(message);
  (*fields)["phase"]     = MakeString(phase);
  for (const auto& [key, value] : extra) {
    (*fields)[key] = value;
  }
  *MutableList(state, keys::kWorkflowLog)->add_values() = std::move(entry);
}

void AddError(State* state, std::string_view phase, std::string_view message, const Struct& details) {
  Value entry = MakeEmptyStruct();
  auto* fields = entry.mutable_struct_value()->mutable_fields();
  (*fields)["phase"] = MakeString(phase);
  (*fields)["error"] = MakeString(message);
  *(*fields)["details"].mutable_struct_value() = details;
  (*fields)["timestamp"] = MakeString(util::NowRfc3339());
  *MutableList(state, keys::kErrors)->add_values() = std::move(entry);
}

void AddWarning(State* state, std::string_view phase, std::string_view message) {
  std::string text = "[";
  text.append(phase).append("] ").append(message);
  *MutableList(state, keys::kWarnings)->add_values() = MakeString(text);
}

void MarkPhaseComplete(State* state, std::string_view phase) {
  auto* value = FindMutable(state, keys::kPhaseCompletion);
  if (!value || value->kind_case() != Value::kStructValue) {
    Set(state, keys::kPhaseCompletion, MakeEmptyStruct());
    value = FindMutable(state, keys::kPhaseCompletion);
  }
  (*value->mutable_struct_value()->mutable_fields())[std::string(phase)] = MakeBool(true);
}

std::size_t ListSize(const State& state, std::string_view key) {
  const auto* value = Find(state, key);
  if (!value || value->kind_case() != Value::kListValue) {
    return 0;
  }
  return static_cast<std::size_t>(value->list_value().values_size());
}

std::string ToJson(const State& state) {
  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(state, &out);
  if (!status.ok()) {
    throw util::SerializationError("state to json failed: " + std::string(status.message()));
  }
  return out;
}

State FromJson(const std::string& json) {
  State      state;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &state);
  if (!status.ok()) {
    throw util::SerializationError("state json parse failed: " + std::string(status.message()));
  }
  return state;
}

bool Equal(const State& a, const State& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace flowstate::state
