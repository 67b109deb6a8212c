// ============================================================================
// frame_codec.cpp — implementation for rfidlink/frame_codec.hpp
// For the wire layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "rfidlink/frame_codec.hpp"

#include <iomanip>   // std::setw, std::setfill for hex output
#include <sstream>   // std::ostringstream for describe()

namespace rfidlink {

// ---------------------------------------------------------------------------
// Low-level helpers
// ---------------------------------------------------------------------------

static inline Frame header(uint8_t tag, Opcode op, uint16_t parameter) {
    Frame f{};
    f[0] = tag;                                    // role tag
    f[1] = static_cast<uint8_t>(op);               // opcode
    f[2] = static_cast<uint8_t>(parameter >> 8);   // parameter, high byte first
    f[3] = static_cast<uint8_t>(parameter & 0xFF);
    return f;
}

bool is_known_opcode(Opcode op) {
    return static_cast<uint8_t>(op) <= static_cast<uint8_t>(Opcode::ReadLast);
}

std::string opcode_name(Opcode op) {
    switch (op) {
        case Opcode::Ping:      return "ping";
        case Opcode::SetCount:  return "set_count";
        case Opcode::SendChunk: return "send_chunk";
        case Opcode::ReadLast:  return "read_last";
    }
    std::ostringstream o;
    o << "op_0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
      << static_cast<unsigned>(op);
    return o.str();
}

// ---------------------------------------------------------------------------
// Encoders
// ---------------------------------------------------------------------------

Frame encode_command(Opcode op, uint16_t parameter) {
    return header(TAG_REQUEST, op, parameter);
}

Frame encode_response(Opcode op, uint16_t parameter) {
    return header(TAG_RESPONSE, op, parameter);
}

Frame encode_entry(uint32_t id) {
    Frame f{};
    f[0] = static_cast<uint8_t>((id >> 24) & 0xFF);
    f[1] = static_cast<uint8_t>((id >> 16) & 0xFF);
    f[2] = static_cast<uint8_t>((id >> 8) & 0xFF);
    f[3] = static_cast<uint8_t>(id & 0xFF);
    return f;
}

void append_entry(std::vector<uint8_t>& out, uint32_t id) {
    const Frame f = encode_entry(id);
    out.insert(out.end(), f.begin(), f.end());
}

// ---------------------------------------------------------------------------
// Decoders
// ---------------------------------------------------------------------------

Status decode_header(const uint8_t* in, std::size_t n, CommandFrame& out) {
    if (!in || n != FRAME_SIZE) return Status::FramingError;

    CommandFrame f;
    if      (in[0] == TAG_REQUEST)  f.role = Role::Request;
    else if (in[0] == TAG_RESPONSE) f.role = Role::Response;
    else return Status::FramingError;                     // not one of ours

    f.opcode    = static_cast<Opcode>(in[1]);
    f.parameter = static_cast<uint16_t>((in[2] << 8) | in[3]);
    out = f;
    return Status::Ok;
}

uint32_t decode_entry(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8)  |
            static_cast<uint32_t>(in[3]);
}

// ---------------------------------------------------------------------------
// Text helpers
// ---------------------------------------------------------------------------

std::string to_hex(const uint8_t* data, std::size_t n) {
    static const char* DIGITS = "0123456789ABCDEF";
    std::string s;
    s.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        s.push_back(DIGITS[data[i] >> 4]);
        s.push_back(DIGITS[data[i] & 0x0F]);
    }
    return s;
}

std::string id_to_hex(uint32_t id) {
    return to_hex(encode_entry(id));
}

std::string describe(const CommandFrame& f) {
    std::ostringstream o;
    o << "role=" << (f.role == Role::Request ? "req" : "resp")
      << " op=" << opcode_name(f.opcode)
      << " param=" << f.parameter;
    return o.str();
}

} // namespace rfidlink
