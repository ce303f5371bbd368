#pragma once

#include <stdexcept>
#include <string>

namespace routine::util {

/*
  Central error types.

  Construction/mutation paths throw these to the caller.
  Execution paths capture them into RoutineExecution.error.
  The gRPC layer translates them to status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
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

// Automatic execution attempted on a disabled routine.
class DisabledRoutine : public std::runtime_error {
 public:
  explicit DisabledRoutine(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised inside a single action; never leaves ExecuteRoutine.
class ActionError : public std::runtime_error {
 public:
  explicit ActionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised inside a trigger tick; logged, the trigger keeps running.
class PollError : public std::runtime_error {
 public:
  explicit PollError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// External integration unreachable, misconfigured or answering with an error.
class ConnectorError : public std::runtime_error {
 public:
  explicit ConnectorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Integration not configured or rejecting its credentials.
class SetupRequired : public ConnectorError {
 public:
  explicit SetupRequired(const std::string& msg) : ConnectorError(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace routine::util
