#pragma once

#include <stdexcept>
#include <string>

namespace artifact::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another transaction won a write race; the unit of work may be retried.
class ConcurrentModification : public std::runtime_error {
 public:
  explicit ConcurrentModification(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The metadata store cannot be reached or refused to work (busy, I/O).
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace artifact::util
