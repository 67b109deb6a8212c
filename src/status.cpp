// ============================================================================
// status.cpp — implementation for rfidlink/status.hpp
// ============================================================================

#include "rfidlink/status.hpp"

namespace rfidlink {

const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:            return "ok";
    case Status::FramingError:  return "framing_error";
    case Status::ProtocolError: return "protocol_error";
    case Status::TimeoutError:  return "timeout";
    case Status::OversizeError: return "oversize";
    case Status::CapacityError: return "capacity";
    case Status::IoError:       return "io_error";
    case Status::Busy:          return "busy";
    case Status::Aborted:       return "aborted";
  }
  return "unknown";
}

bool is_retryable(Status s) {
  switch (s) {
    case Status::TimeoutError:
    case Status::ProtocolError:
    case Status::FramingError:
    case Status::IoError:
      return true;
    default:
      return false;
  }
}

} // namespace rfidlink
