#pragma once

#include <stdexcept>
#include <string>

namespace tams::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed time range, timestamp or identifier. Raised before any mutation.
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Segment insert without replace semantics collides with existing coverage.
class OverlapConflict : public std::runtime_error {
 public:
  explicit OverlapConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReadOnlyFlow : public std::runtime_error {
 public:
  explicit ReadOnlyFlow(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Underlying transaction or storage engine failure. The enclosing transaction is rolled back.
class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Webhook delivery retries exhausted. Logged by the notifier, never surfaced to callers.
class DeliveryExhausted : public std::runtime_error {
 public:
  explicit DeliveryExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tams::util
