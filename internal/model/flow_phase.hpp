#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace flowstate::model {

enum class Phase : std::uint8_t {
  kInitialization     = 0,
  kDataImport         = 1,
  kFieldMapping       = 2,
  kDataCleansing      = 3,
  kAssetInventory     = 4,
  kDependencyAnalysis = 5,
  kTechDebtAnalysis   = 6,
  kCompleted          = 7,
};

enum class Status : std::uint8_t {
  kInitialized        = 0,
  kRunning            = 1,
  kPaused             = 2,
  kWaitingForApproval = 3,
  kCompleted          = 4,
  kFailed             = 5,
  kCancelled          = 6,
};

inline constexpr std::array<Phase, 8> kAllPhases = {
    Phase::kInitialization, Phase::kDataImport,         Phase::kFieldMapping,     Phase::kDataCleansing,
    Phase::kAssetInventory, Phase::kDependencyAnalysis, Phase::kTechDebtAnalysis, Phase::kCompleted,
};

inline constexpr std::array<Status, 7> kAllStatuses = {
    Status::kInitialized, Status::kRunning, Status::kPaused,    Status::kWaitingForApproval,
    Status::kCompleted,   Status::kFailed,  Status::kCancelled,
};

constexpr std::string_view ToString(Phase phase) {
  switch (phase) {
    case Phase::kInitialization:
      return "initialization";
    case Phase::kDataImport:
      return "data_import";
    case Phase::kFieldMapping:
      return "field_mapping";
    case Phase::kDataCleansing:
      return "data_cleansing";
    case Phase::kAssetInventory:
      return "asset_inventory";
    case Phase::kDependencyAnalysis:
      return "dependency_analysis";
    case Phase::kTechDebtAnalysis:
      return "tech_debt_analysis";
    case Phase::kCompleted:
      return "completed";
  }
  return "unknown";
}

constexpr std::string_view ToString(Status status) {
  switch (status) {
    case Status::kInitialized:
      return "initialized";
    case Status::kRunning:
      return "running";
    case Status::kPaused:
      return "paused";
    case Status::kWaitingForApproval:
      return "waiting_for_approval";
    case Status::kCompleted:
      return "completed";
    case Status::kFailed:
      return "failed";
    case Status::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<Phase> ParsePhase(std::string_view name) {
  for (Phase phase : kAllPhases) {
    if (ToString(phase) == name) {
      return phase;
    }
  }
  return std::nullopt;
}

constexpr std::optional<Status> ParseStatus(std::string_view name) {
  for (Status status : kAllStatuses) {
    if (ToString(status) == name) {
      return status;
    }
  }
  return std::nullopt;
}

constexpr bool IsTerminal(Phase phase) {
  return phase == Phase::kCompleted;
}

constexpr std::optional<Phase> NextPhase(Phase phase) {
  if (IsTerminal(phase)) {
    return std::nullopt;
  }
  return static_cast<Phase>(static_cast<std::uint8_t>(phase) + 1);
}

// Unforced transitions follow the chain one step at a time.
constexpr bool CanTransition(Phase from, Phase to) {
  const auto next = NextPhase(from);
  return next.has_value() && *next == to;
}

constexpr int ProgressFor(Phase phase) {
  switch (phase) {
    case Phase::kInitialization:
      return 0;
    case Phase::kDataImport:
      return 15;
    case Phase::kFieldMapping:
      return 30;
    case Phase::kDataCleansing:
      return 45;
    case Phase::kAssetInventory:
      return 60;
    case Phase::kDependencyAnalysis:
      return 75;
    case Phase::kTechDebtAnalysis:
      return 90;
    case Phase::kCompleted:
      return 100;
  }
  return 0;
}

// Statuses that make a flow a recovery candidate. "error" is accepted for
// documents written by older producers.
constexpr bool NeedsRecovery(std::string_view status) {
  return status == "failed" || status == "paused" || status == "error";
}

static_assert(CanTransition(Phase::kInitialization, Phase::kDataImport));
static_assert(!CanTransition(Phase::kInitialization, Phase::kCompleted));
static_assert(!CanTransition(Phase::kCompleted, Phase::kInitialization));

} // namespace flowstate::model
