#pragma once

#include <stdexcept>
#include <string>

namespace subnet::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested network id is not registered. Raised before any mutation.
class NetworkDoesNotExist : public NotFound {
 public:
  explicit NetworkDoesNotExist(const std::string& msg) : NotFound(msg) {
  }
};

// Registrant cannot cover the current lock cost. Raised before eviction or charge.
class InsufficientLock : public InvalidState {
 public:
  explicit InsufficientLock(const std::string& msg) : InvalidState(msg) {
  }
};

// Network count is at capacity and every live network is still immune.
class SubnetLimitReached : public ResourceExhausted {
 public:
  explicit SubnetLimitReached(const std::string& msg) : ResourceExhausted(msg) {
  }
};

} // namespace subnet::util
