#pragma once
/**
 * @file status.hpp
 * @brief Result codes shared by every layer of the rfidlink protocol engine.
 *
 * The engine never throws. Each operation returns a Status and, where it
 * produces data, fills an out-parameter. Stable snake_case tokens from
 * status_name() are what the CLI prints after "reason=" so shell scripts
 * can branch on them.
 *
 * Taxonomy:
 *  - FramingError   malformed header or unrecognized tag byte
 *  - ProtocolError  well-formed acknowledgment with the wrong opcode/parameter/role
 *  - TimeoutError   no complete response inside response_timeout
 *  - OversizeError  a chunk that cannot fit the device receive buffer (caller contract)
 *  - CapacityError  total count not representable in the 16-bit SetCount parameter
 *  - IoError        the channel itself failed (write/read syscall error)
 *  - Busy           a command was issued while another exchange is still pending
 *  - Aborted        the caller cancelled an upload between chunks
 */

#include <cstdint>

namespace rfidlink {

enum class Status : uint8_t {
  Ok = 0,
  FramingError,
  ProtocolError,
  TimeoutError,
  OversizeError,
  CapacityError,
  IoError,
  Busy,
  Aborted
};

/// Stable token for logs and `reason=` output ("ok", "timeout", ...).
const char* status_name(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

/**
 * @brief True for failures that a fresh attempt might cure.
 *
 * Timeouts, bad echoes and link errors are transient from the host's point
 * of view. Capacity/oversize are caller contract violations and Aborted is a
 * caller decision, so repeating them changes nothing.
 */
bool is_retryable(Status s);

} // namespace rfidlink
