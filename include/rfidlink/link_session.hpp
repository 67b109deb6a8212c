#pragma once
/**
 * @page rl-link-session rfidlink Link Session
 * @file link_session.hpp
 * @brief One command, one acknowledgment: the request/response engine for the lock controller.
 *
 * @details
 * PURPOSE
 * -------
 * The lock controller has no request identifiers and no sequence numbers.
 * The only way to know which command an acknowledgment belongs to is to never
 * have more than one command outstanding. LinkSession enforces that: every
 * operation writes its request, waits for the echo, validates it, and only
 * then lets the next command through.
 *
 * OPERATIONS
 * ----------
 *   ping()          CD 00 0000            -> expect DC 00 0000
 *   set_count(n)    CD 01 nnnn            -> expect DC 01 nnnn
 *   send_chunk(ids) CD 02 kkkk + k*4 bytes -> expect DC 02 kkkk
 *   read_last(id)   CD 03 0000            -> expect DC 03 0000 then 4 raw bytes
 *
 * ERROR MAPPING
 * -------------
 *   channel write/read failure           -> IoError
 *   fewer than 4 bytes before deadline   -> TimeoutError
 *   tag byte not CD/DC, or short frame   -> FramingError
 *   request tag echoed, wrong opcode/param -> ProtocolError
 *   chunk header+payload over the budget -> OversizeError (nothing written)
 *   command issued while one is pending  -> Busy
 *
 * EXCHANGE STATE
 * --------------
 *   Idle -> AwaitingResponse -> Complete
 *                          \-> Failed
 * A new command is refused with Busy while the state is AwaitingResponse.
 * After a Failed exchange the next command discards stale input first, so a
 * late acknowledgment is not taken as the answer to a new request.
 *
 * EXAMPLE
 * -------
 * @code
 *   rfidlink::transport::LinuxSerial port;
 *   std::string err;
 *   port.open({"/dev/ttyUSB0", 9600, 0}, err);
 *
 *   rfidlink::LinkSession link(port, {2000, rfidlink::DEVICE_FRAME_BUDGET});
 *   if (link.ping() != rfidlink::Status::Ok) { ... }
 *
 *   uint32_t last = 0;
 *   if (link.read_last(last) == rfidlink::Status::Ok) {
 *     std::cout << rfidlink::id_to_hex(last) << "\n";
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rfidlink/frame_codec.hpp"
#include "rfidlink/status.hpp"
#include "rfidlink/transport/channel.hpp"

namespace rfidlink {

enum class SessionState : uint8_t { Idle, AwaitingResponse, Complete, Failed };

const char* session_state_name(SessionState s);

struct SessionOptions {
  int         response_timeout_ms{2000};              ///< max wait for a 4-byte response
  std::size_t max_frame_bytes{DEVICE_FRAME_BUDGET};   ///< SendChunk header+payload limit
};

/// Largest entry count whose header plus payload fits in @p max_frame_bytes.
inline std::size_t max_entries_for_budget(std::size_t max_frame_bytes) {
  return max_frame_bytes < FRAME_SIZE ? 0 : (max_frame_bytes - FRAME_SIZE) / FRAME_SIZE;
}

class LinkSession {
public:
  explicit LinkSession(transport::Channel& channel, SessionOptions opts = {});

  LinkSession(const LinkSession&) = delete;
  LinkSession& operator=(const LinkSession&) = delete;

  Status ping();
  Status set_count(uint16_t n);

  /**
   * @brief Send one SendChunk header followed by @p count entries.
   *
   * Checks 4 + 4*count <= max_frame_bytes (never above 255) before anything
   * is written; a violation returns OversizeError and leaves the channel and
   * the exchange state untouched.
   */
  Status send_chunk(const uint32_t* entries, std::size_t count);
  Status send_chunk(const std::vector<uint32_t>& entries) {
    return send_chunk(entries.data(), entries.size());
  }

  /// Read the identifier most recently scanned at the lock.
  Status read_last(uint32_t& out);

  SessionState state() const { return state_; }
  Opcode last_opcode() const { return last_opcode_; }
  uint16_t expected_parameter() const { return expected_param_; }
  const SessionOptions& options() const { return opts_; }

private:
  Status begin(Opcode op, uint16_t expected);
  Status finish(Status s);
  Status transmit(const uint8_t* data, std::size_t len);
  Status receive(uint8_t* out, std::size_t n);
  Status await_ack();

  transport::Channel& channel_;
  SessionOptions opts_;

  SessionState state_{SessionState::Idle};
  Opcode   last_opcode_{Opcode::Ping};
  uint16_t expected_param_{0};
};

} // namespace rfidlink
