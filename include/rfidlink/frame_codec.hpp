#pragma once
/**
 * @page rl-frame-codec rfidlink Frame Codec
 * @file frame_codec.hpp
 * @brief Encoders and decoders for the lock controller's fixed 4-byte frames.
 *
 * @details
 * PURPOSE
 * -------
 * The lock controller speaks a tiny binary protocol over its UART. Every
 * exchange is built from 4-byte frames, all big-endian:
 *
 *   Command/response header:  [tag][opcode][param_hi][param_lo]
 *   Data entry:               [id_3][id_2][id_1][id_0]
 *
 *   tag    0xCD request (host -> device), 0xDC response (device -> host)
 *   opcode 0 Ping, 1 SetCount, 2 SendChunk, 3 ReadLast
 *   param  16-bit, meaning depends on the opcode
 *
 * This file is the only place that knows the byte layout. The link session
 * (link_session.hpp) decides *when* frames go out; this layer only turns
 * values into bytes and back.
 *
 * PER-OPCODE PARAMETER
 * --------------------
 *   Ping      unused, always 0
 *   SetCount  total number of identifiers the upload will deliver
 *   SendChunk number of 4-byte entries that immediately follow the header
 *   ReadLast  unused, 0; the acknowledgment is followed by one raw entry
 *
 * EXAMPLE
 * -------
 * @code
 *   auto req = rfidlink::encode_command(rfidlink::Opcode::SetCount, 110);
 *   // req == CD 01 00 6E
 *
 *   rfidlink::CommandFrame f;
 *   const uint8_t ack[4] = {0xDC, 0x01, 0x00, 0x6E};
 *   if (rfidlink::decode_header(ack, 4, f) == rfidlink::Status::Ok) {
 *     // f.role == Role::Response, f.opcode == Opcode::SetCount, f.parameter == 110
 *   }
 * @endcode
 *
 * MAINTENANCE
 * -----------
 * - Tags and opcodes are part of the device firmware contract. Never renumber.
 * - Keep these functions pure: no I/O, no logging, no allocation beyond the
 *   caller-owned vectors.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rfidlink/status.hpp"

namespace rfidlink {

// =============================== Wire constants ===============================

static constexpr std::size_t FRAME_SIZE = 4;        ///< header and entry size in bytes
static constexpr uint8_t TAG_REQUEST    = 0xCD;     ///< host -> device
static constexpr uint8_t TAG_RESPONSE   = 0xDC;     ///< device -> host

/// Device receive buffer: header plus payload of one SendChunk must fit here.
static constexpr std::size_t DEVICE_FRAME_BUDGET = 255;

/// Largest value the 16-bit parameter field can carry.
static constexpr uint32_t MAX_PARAMETER = 0xFFFF;

enum class Role : uint8_t { Request, Response };

enum class Opcode : uint8_t {
  Ping      = 0,
  SetCount  = 1,
  SendChunk = 2,
  ReadLast  = 3
};

/// One fixed 4-byte frame as it travels on the wire.
using Frame = std::array<uint8_t, FRAME_SIZE>;

/**
 * @brief Decoded command/response header.
 *
 * The opcode byte is kept as received. A byte outside 0..3 still decodes;
 * is_known_opcode() tells the session it cannot be a valid acknowledgment.
 */
struct CommandFrame {
  Role     role{Role::Request};
  Opcode   opcode{Opcode::Ping};
  uint16_t parameter{0};
};

bool is_known_opcode(Opcode op);

/// "ping", "set_count", "send_chunk", "read_last", or "op_0x??".
std::string opcode_name(Opcode op);

// =============================== Encoders ===============================

/// Request header: CD, opcode, parameter big-endian.
Frame encode_command(Opcode op, uint16_t parameter);

/// Response header: DC, opcode, parameter big-endian. Used by device emulators and tests.
Frame encode_response(Opcode op, uint16_t parameter);

/// Identifier as 4 bytes big-endian, no tag.
Frame encode_entry(uint32_t id);

/// Append the 4-byte encoding of @p id to @p out.
void append_entry(std::vector<uint8_t>& out, uint32_t id);

// =============================== Decoders ===============================

/**
 * @brief Parse a 4-byte header.
 *
 * @param in   Pointer to received bytes.
 * @param n    Number of bytes at @p in; must be exactly FRAME_SIZE.
 * @param out  Filled on success.
 *
 * @return Status::Ok, or Status::FramingError when @p n != 4 or the tag byte is
 *         neither 0xCD nor 0xDC. @p out is left untouched on failure.
 */
Status decode_header(const uint8_t* in, std::size_t n, CommandFrame& out);

inline Status decode_header(const Frame& f, CommandFrame& out) {
  return decode_header(f.data(), f.size(), out);
}

/// Big-endian identifier from exactly 4 bytes.
uint32_t decode_entry(const uint8_t* in);

inline uint32_t decode_entry(const Frame& f) { return decode_entry(f.data()); }

// =============================== Text helpers ===============================

/// Uppercase hex, no separators: {0xCD,0x01,0x00,0x32} -> "CD010032".
std::string to_hex(const uint8_t* data, std::size_t n);

inline std::string to_hex(const Frame& f) { return to_hex(f.data(), f.size()); }

/// Identifier as 8 uppercase hex digits ("0000002A").
std::string id_to_hex(uint32_t id);

/**
 * @brief One-line summary for logs: "role=resp op=set_count param=50".
 */
std::string describe(const CommandFrame& f);

} // namespace rfidlink
