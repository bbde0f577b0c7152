#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netvisor {

using json = nlohmann::json;

// Type aliases
using DaemonId = std::string;
using HostId = std::string;
using NetworkId = std::string;
using SessionId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Source of "now". Injected so tests can move time forward.
using Clock = std::function<Timestamp()>;

Clock system_clock();

int64_t to_epoch_ms(const Timestamp &ts);

Timestamp from_epoch_ms(int64_t ms);

// Failure categories shared by the store, the fleet service and the session table
enum class ErrorKind {
  Conflict,              // Uniqueness violation on create/update
  NotFound,              // Referenced id does not exist
  TransportFailure,      // Daemon could not be reached
  RemoteRejected,        // Daemon reachable but reported failure
  SerializationFailure,  // Malformed stored or transmitted payload
  InvalidTransition,     // Illegal session state change
  StorageFailure         // Backing engine failed (I/O)
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::StorageFailure;
  std::string message;

  std::string describe() const {
    return to_string(kind) + ": " + message;
  }
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  bool is(ErrorKind kind) const {
    return error && error->kind == kind;
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }

  static Result failure(ErrorKind kind, std::string message) {
    return Result{std::nullopt, Error{kind, std::move(message)}};
  }
};

// Result of an operation with no value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  bool is(ErrorKind kind) const {
    return error && error->kind == kind;
  }

  static Status success() {
    return Status{};
  }

  static Status failure(Error err) {
    return Status{std::move(err)};
  }

  static Status failure(ErrorKind kind, std::string message) {
    return Status{Error{kind, std::move(message)}};
  }
};

}  // namespace netvisor
