#pragma once

#include <stdexcept>
#include <string>

namespace syncq::util {

/*
  Central error types.

  The store layer reports db::Result codes; SyncQueue translates them
  into these before they reach callers.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// enqueue at capacity under Reject, or Block timed out
class QueueFull : public std::runtime_error {
 public:
  explicit QueueFull(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ShuttingDown : public std::runtime_error {
 public:
  explicit ShuttingDown(const std::string& msg) : std::runtime_error(msg) {
  }
};

// queue saw a fatal store error and refuses new work
class Degraded : public std::runtime_error {
 public:
  explicit Degraded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EncodeError : public std::runtime_error {
 public:
  explicit EncodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IllegalTransition : public std::runtime_error {
 public:
  explicit IllegalTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StaleReservation : public std::runtime_error {
 public:
  explicit StaleReservation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// busy database, pool acquire timeout
class StoreTransient : public std::runtime_error {
 public:
  explicit StoreTransient(const std::string& msg) : std::runtime_error(msg) {
  }
};

// corruption, I/O failure, broken pool
class StoreFatal : public std::runtime_error {
 public:
  explicit StoreFatal(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Codec failures. Any of these on a stored item makes it Undecodable.
*/
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuthFailure : public CodecError {
 public:
  explicit AuthFailure(const std::string& msg) : CodecError(msg) {
  }
};

class AlgoUnknown : public CodecError {
 public:
  explicit AlgoUnknown(const std::string& msg) : CodecError(msg) {
  }
};

class KeyMismatch : public CodecError {
 public:
  explicit KeyMismatch(const std::string& msg) : CodecError(msg) {
  }
};

class CorruptPayload : public CodecError {
 public:
  explicit CorruptPayload(const std::string& msg) : CodecError(msg) {
  }
};

} // namespace syncq::util
