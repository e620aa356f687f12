#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace tripgraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes and to skip
  categories in the ingest report.
*/

// Dataset or graph store cannot be reached. Fatal to a run.
class SourceUnavailable : public std::runtime_error {
 public:
  explicit SourceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A raw record (or one of its fields) could not be read.
class RecordMalformed : public std::runtime_error {
 public:
  explicit RecordMalformed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A per-record write transaction failed and was rolled back.
class WriteConflict : public std::runtime_error {
 public:
  WriteConflict(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

  // Busy stores and serialization failures are worth another attempt.
  bool Transient() const {
    return code_ == db::ErrorCode::Busy || code_ == db::ErrorCode::SerializationFailure || code_ == db::ErrorCode::Conflict;
  }

 private:
  db::ErrorCode code_;
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tripgraph::util
