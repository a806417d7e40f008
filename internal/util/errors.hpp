#pragma once

#include <stdexcept>
#include <string>

namespace usedgear::util {

/*
  Central error types.

  Engine operations throw these before mutating state, so a caught error
  always leaves the market in its last-known-good state. The gRPC adapter
  translates them to status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Missing listing, search, sale or inspection.
class NotFound : public ValidationError {
 public:
  explicit NotFound(const std::string& msg) : ValidationError(msg) {
  }
};

// Per-requester caps (active searches).
class LimitExceeded : public ValidationError {
 public:
  explicit LimitExceeded(const std::string& msg) : ValidationError(msg) {
  }
};

class FundsError : public std::runtime_error {
 public:
  explicit FundsError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A second action on a listing that has already been resolved.
class RaceRejection : public std::runtime_error {
 public:
  explicit RaceRejection(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptRecordError : public std::runtime_error {
 public:
  explicit CorruptRecordError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace usedgear::util
