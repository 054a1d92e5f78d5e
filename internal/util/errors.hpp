#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flowstate::util {

/*
  Central error types.

  Every engine error carries a discriminated kind so callers can branch
  on NotFound / Conflict / Invalid / Fatal without matching messages.
*/

enum class ErrorKind {
  kNotFound,
  kConflict,
  kInvalid,
  kFatal,
};

constexpr const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kConflict:
      return "conflict";
    case ErrorKind::kInvalid:
      return "invalid";
    case ErrorKind::kFatal:
      return "fatal";
  }
  return "unknown";
}

class FlowStateError : public std::runtime_error {
 public:
  FlowStateError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class NotFoundError : public FlowStateError {
 public:
  explicit NotFoundError(const std::string& msg) : FlowStateError(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExistsError : public FlowStateError {
 public:
  explicit AlreadyExistsError(const std::string& msg) : FlowStateError(ErrorKind::kConflict, msg) {
  }
};

// Version mismatch on write. The caller reloads and retries or aborts.
class ConcurrentModificationError : public FlowStateError {
 public:
  ConcurrentModificationError(const std::string& msg, uint64_t expected_version, uint64_t actual_version)
      : FlowStateError(ErrorKind::kConflict, msg), expected_version_(expected_version), actual_version_(actual_version) {
  }

  uint64_t ExpectedVersion() const noexcept {
    return expected_version_;
  }
  uint64_t ActualVersion() const noexcept {
    return actual_version_;
  }

 private:
  uint64_t expected_version_;
  uint64_t actual_version_;
};

class ValidationError : public FlowStateError {
 public:
  ValidationError(const std::string& msg, std::vector<std::string> errors = {})
      : FlowStateError(ErrorKind::kInvalid, msg), errors_(std::move(errors)) {
  }

  const std::vector<std::string>& Errors() const noexcept {
    return errors_;
  }

 private:
  std::vector<std::string> errors_;
};

class InvalidTransitionError : public FlowStateError {
 public:
  explicit InvalidTransitionError(const std::string& msg) : FlowStateError(ErrorKind::kInvalid, msg) {
  }
};

class SerializationError : public FlowStateError {
 public:
  explicit SerializationError(const std::string& msg) : FlowStateError(ErrorKind::kInvalid, msg) {
  }
};

class EncryptionError : public FlowStateError {
 public:
  explicit EncryptionError(const std::string& msg) : FlowStateError(ErrorKind::kFatal, msg) {
  }
};

// Requires operator intervention for the affected flow.
class StateRecoveryError : public FlowStateError {
 public:
  explicit StateRecoveryError(const std::string& msg) : FlowStateError(ErrorKind::kFatal, msg) {
  }
};

class StorageError : public FlowStateError {
 public:
  explicit StorageError(const std::string& msg) : FlowStateError(ErrorKind::kFatal, msg) {
  }
};

} // namespace flowstate::util
