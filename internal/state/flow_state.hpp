#pragma once

#include <google/protobuf/struct.pb.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace flowstate::state {

/*
  Flow state document helpers.

  A flow state is a google::protobuf::Struct (a JSON object). The engine
  only interprets the bookkeeping keys below; everything else is opaque
  domain payload carried through untouched.
*/

using State = google::protobuf::Struct;

namespace keys {
inline constexpr std::string_view kFlowId          = "flow_id";
inline constexpr std::string_view kTenantId        = "tenant_id";
inline constexpr std::string_view kCurrentPhase    = "current_phase";
inline constexpr std::string_view kStatus          = "status";
inline constexpr std::string_view kProgress        = "progress_percentage";
inline constexpr std::string_view kPhaseCompletion = "phase_completion";
inline constexpr std::string_view kPhaseResults    = "phase_results";
inline constexpr std::string_view kErrors          = "errors";
inline constexpr std::string_view kWarnings        = "warnings";
inline constexpr std::string_view kWorkflowLog     = "workflow_log";
inline constexpr std::string_view kRawData         = "raw_data";
inline constexpr std::string_view kCreatedAt       = "created_at";
inline constexpr std::string_view kUpdatedAt       = "updated_at";
inline constexpr std::string_view kCompletedAt     = "completed_at";
} // namespace keys

using ExtraField = std::pair<std::string, google::protobuf::Value>;

google::protobuf::Value MakeString(std::string_view value);
google::protobuf::Value MakeNumber(double value);
google::protobuf::Value MakeBool(bool value);
google::protobuf::Value MakeNull();
google::protobuf::Value MakeEmptyList();
google::protobuf::Value MakeEmptyStruct();

const google::protobuf::Value* Find(const State& state, std::string_view key);
google::protobuf::Value*       FindMutable(State* state, std::string_view key);

bool Has(const State& state, std::string_view key);

// Empty string when the key is absent or not a string.
std::string           GetString(const State& state, std::string_view key);
std::optional<double> GetNumber(const State& state, std::string_view key);

void Set(State* state, std::string_view key, google::protobuf::Value value);
void SetString(State* state, std::string_view key, std::string_view value);
void SetNumber(State* state, std::string_view key, double value);
void Erase(State* state, std::string_view key);

// Adds any missing collection-typed bookkeeping field as an empty
// collection. Existing values are left as they are.
void EnsureCollections(State* state);

State NewInitialState(const std::string& flow_id, const std::string& tenant_id, google::protobuf::Value raw_data);

// workflow_log entry {timestamp, event, message, phase, ...extra}
void AppendLog(State* state, std::string_view event, std::string_view message, std::string_view phase,
               std::initializer_list<ExtraField> extra = {});

// errors entry {phase, error, details, timestamp}
void AddError(State* state, std::string_view phase, std::string_view message, const google::protobuf::Struct& details);

// warnings entry "[phase] message"
void AddWarning(State* state, std::string_view phase, std::string_view message);

void MarkPhaseComplete(State* state, std::string_view phase);

std::size_t ListSize(const State& state, std::string_view key);

std::string ToJson(const State& state);

// Throws SerializationError when the text is not a JSON object.
State FromJson(const std::string& json);

bool Equal(const State& a, const State& b);

} // namespace flowstate::state
