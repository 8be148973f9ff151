#pragma once

#include <stdexcept>
#include <string>

namespace planner::util {

/*
  Central error types.

  ValidationError subclasses are raised before any work starts and are
  always fatal to the call. The engine rethrows them unchanged; anything
  else escaping a run is wrapped into AllocationFailed / OptimizationFailed.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidWindow : public ValidationError {
 public:
  explicit InvalidWindow(const std::string& msg) : ValidationError(msg) {
  }
};

class PastWindow : public ValidationError {
 public:
  explicit PastWindow(const std::string& msg) : ValidationError(msg) {
  }
};

class NoResources : public ValidationError {
 public:
  explicit NoResources(const std::string& msg) : ValidationError(msg) {
  }
};

class NoProcesses : public ValidationError {
 public:
  explicit NoProcesses(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidRestriction : public ValidationError {
 public:
  explicit InvalidRestriction(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidProcessState : public ValidationError {
 public:
  explicit InvalidProcessState(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidParameters : public ValidationError {
 public:
  explicit InvalidParameters(const std::string& msg) : ValidationError(msg) {
  }
};

// Model-level errors (construction and state transitions).

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Runtime config could not be read or does not match the schema.

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Run-level wrappers. The original cause is attached as a nested exception.

class AllocationFailed : public std::runtime_error {
 public:
  explicit AllocationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OptimizationFailed : public std::runtime_error {
 public:
  explicit OptimizationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace planner::util
