#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace jobclaim::util {

/*
  Central error types.

  Repository code reports db::Result codes; services translate them into
  these exceptions. jobctl maps them to exit codes.
*/

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Structurally malformed job envelope. Never retried.
class InvalidEnvelope : public std::runtime_error {
 public:
  InvalidEnvelope(const std::string& msg, std::vector<std::string> errors)
      : std::runtime_error(msg), errors_(std::move(errors)) {
  }

  const std::vector<std::string>& Errors() const {
    return errors_;
  }

 private:
  std::vector<std::string> errors_;
};

// Batch is held by a live claim of another worker. Retry later.
class ClaimConflict : public std::runtime_error {
 public:
  ClaimConflict(const std::string& msg, std::string run_id) : std::runtime_error(msg), run_id_(std::move(run_id)) {
  }

  const std::string& RunId() const {
    return run_id_;
  }

 private:
  std::string run_id_;
};

class ReconciliationMismatch : public std::runtime_error {
 public:
  ReconciliationMismatch(const std::string& msg, long long delta) : std::runtime_error(msg), delta_(delta) {
  }

  long long Delta() const {
    return delta_;
  }

 private:
  long long delta_;
};

// Storage failure that is not a domain condition (busy, I/O, constraint).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobclaim::util
