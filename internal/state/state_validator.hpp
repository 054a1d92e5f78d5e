#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/state/flow_state.hpp"

namespace flowstate::state {

struct ValidationResult {
  bool                     valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/*
  Pure structural and integrity checks of a flow state document.
  No I/O, no clock access beyond parsing timestamps.
*/
class StateValidator {
 public:
  static ValidationResult Validate(const State& state);

  // True only when target is the phase immediately following the current one.
  static bool ValidatePhaseTransition(const State& state, std::string_view target_phase);

  // Throws ValidationError carrying every error of the result.
  static void ThrowIfInvalid(const ValidationResult& result, const std::string& context);
};

} // namespace flowstate::state
