#include "internal/state/state_validator.hpp"

#include <cmath>
#include <optional>

#include "internal/model/flow_phase.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstate::state {

using google::protobuf::Value;

namespace {

void CheckIdentity(const State& state, std::string_view key, ValidationResult* result) {
  const auto* value = Find(state, key);
  if (!value) {
    result->errors.push_back("missing required field: " + std::string(key));
  } else if (value->kind_case() != Value::kStringValue || value->string_value().empty()) {
    result->errors.push_back(std::string(key) + " must be a non-empty string");
  }
}

void CheckList(const State& state, std::string_view key, ValidationResult* result) {
  const auto* value = Find(state, key);
  if (!value) {
    result->errors.push_back("missing required field: " + std::string(key));
  } else if (value->kind_case() != Value::kListValue) {
    result->errors.push_back(std::string(key) + " must be a list");
  }
}

std::optional<util::TimePoint> CheckTimestamp(const State& state, std::string_view key, ValidationResult* result) {
  const auto* value = Find(state, key);
  if (!value || value->kind_case() == Value::kNullValue) {
    return std::nullopt;
  }
  if (value->kind_case() != Value::kStringValue) {
    result->errors.push_back(std::string(key) + " must be an RFC 3339 string");
    return std::nullopt;
  }
  auto parsed = util::ParseRfc3339(value->string_value());
  if (!parsed) {
    result->errors.push_back(std::string(key) + " is not a valid RFC 3339 timestamp: " + value->string_value());
  }
  return parsed;
}

} // namespace

ValidationResult StateValidator::Validate(const State& state) {
  ValidationResult result;

  CheckIdentity(state, keys::kFlowId, &result);
  CheckIdentity(state, keys::kTenantId, &result);

  const auto phase = model::ParsePhase(GetString(state, keys::kCurrentPhase));
  if (!Has(state, keys::kCurrentPhase)) {
    result.errors.push_back("missing required field: current_phase");
  } else if (!phase) {
    result.errors.push_back("invalid phase: " + GetString(state, keys::kCurrentPhase));
  }

  const auto status = model::ParseStatus(GetString(state, keys::kStatus));
  if (!Has(state, keys::kStatus)) {
    result.errors.push_back("missing required field: status");
  } else if (!status) {
    result.errors.push_back("invalid status: " + GetString(state, keys::kStatus));
  }

  if (Has(state, keys::kProgress)) {
    const auto progress = GetNumber(state, keys::kProgress);
    if (!progress) {
      result.errors.push_back("progress_percentage must be a number");
    } else if (!std::isfinite(*progress)) {
      result.errors.push_back("progress_percentage is not a finite number");
    } else if (*progress < 0 || *progress > 100) {
      result.errors.push_back("progress_percentage out of range [0,100]: " + std::to_string(*progress));
    }
  } else {
    result.errors.push_back("missing required field: progress_percentage");
  }

  const auto* completion = Find(state, keys::kPhaseCompletion);
  bool        current_phase_done = false;
  if (!completion) {
    result.errors.push_back("missing required field: phase_completion");
  } else if (completion->kind_case() != Value::kStructValue) {
    result.errors.push_back("phase_completion must be a mapping");
  } else {
    for (const auto& [name, done] : completion->struct_value().fields()) {
      if (done.kind_case() != Value::kBoolValue) {
        result.errors.push_back("phase_completion." + name + " must be a boolean");
      } else if (phase && done.bool_value() && name == model::ToString(*phase)) {
        current_phase_done = true;
      }
    }
  }

  const auto* results = Find(state, keys::kPhaseResults);
  if (results && results->kind_case() != Value::kStructValue) {
    result.errors.push_back("phase_results must be a mapping");
  }

  CheckList(state, keys::kErrors, &result);
  CheckList(state, keys::kWarnings, &result);
  CheckList(state, keys::kWorkflowLog, &result);

  const auto created   = CheckTimestamp(state, keys::kCreatedAt, &result);
  const auto updated   = CheckTimestamp(state, keys::kUpdatedAt, &result);
  const bool completed = status && *status == model::Status::kCompleted;

  if (Has(state, keys::kCompletedAt)) {
    CheckTimestamp(state, keys::kCompletedAt, &result);
    const auto* completed_at = Find(state, keys::kCompletedAt);
    if (!completed && completed_at->kind_case() != Value::kNullValue) {
      result.errors.push_back("completed_at is set but status is not completed");
    }
  }

  if (created && updated && *updated < *created) {
    result.errors.push_back("updated_at is earlier than created_at");
  }

  if (current_phase_done && !completed) {
    result.warnings.push_back("current phase " + std::string(model::ToString(*phase)) + " is marked complete but flow is not completed");
  }

  result.valid = result.errors.empty();
  return result;
}

bool StateValidator::ValidatePhaseTransition(const State& state, std::string_view target_phase) {
  const auto current = model::ParsePhase(GetString(state, keys::kCurrentPhase));
  const auto target  = model::ParsePhase(target_phase);
  if (!current || !target) {
    return false;
  }
  return model::CanTransition(*current, *target);
}

void StateValidator::ThrowIfInvalid(const ValidationResult& result, const std::string& context) {
  if (result.valid) {
    return;
  }
  std::string message = context + ": state validation failed";
  for (const auto& error : result.errors) {
    message += "; " + error;
  }
  throw util::ValidationError(message, result.errors);
}

} // namespace flowstate::state
