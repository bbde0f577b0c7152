#include "core/types.hpp"

namespace netvisor {

Clock system_clock() {
  return [] {
    return std::chrono::system_clock::now();
  };
}

int64_t to_epoch_ms(const Timestamp &ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Conflict:
      return "conflict";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::TransportFailure:
      return "transport_failure";
    case ErrorKind::RemoteRejected:
      return "remote_rejected";
    case ErrorKind::SerializationFailure:
      return "serialization_failure";
    case ErrorKind::InvalidTransition:
      return "invalid_transition";
    case ErrorKind::StorageFailure:
      return "storage_failure";
  }
  return "unknown";
}

}  // namespace netvisor
