// ============================================================================
// link_session.cpp — implementation for rfidlink/link_session.hpp
// For the exchange model see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "rfidlink/link_session.hpp"
#include "rfidlink/log.hpp"

#include <algorithm>   // std::min
#include <string>

namespace rfidlink {

using transport::IoResult;

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Idle:             return "idle";
        case SessionState::AwaitingResponse: return "awaiting_response";
        case SessionState::Complete:         return "complete";
        case SessionState::Failed:           return "failed";
    }
    return "unknown";
}

LinkSession::LinkSession(transport::Channel& channel, SessionOptions opts)
    : channel_(channel), opts_(opts) {
    opts_.max_frame_bytes = std::min(opts_.max_frame_bytes, DEVICE_FRAME_BUDGET);
}

// ---------------------------------------------------------------------------
// Exchange bookkeeping
// ---------------------------------------------------------------------------

// Open a new exchange. Refuses while another is pending.
Status LinkSession::begin(Opcode op, uint16_t expected) {
    if (state_ == SessionState::AwaitingResponse) {
        log_line(LogLevel::Warn, "op=" + opcode_name(op) + " reason=busy pending=" +
                                 opcode_name(last_opcode_) + " state=" + session_state_name(state_));
        return Status::Busy;
    }
    if (state_ == SessionState::Failed) {
        log_line(LogLevel::Debug, std::string("chan=") + channel_.name() + " discard=stale_input");
        channel_.discard_input();                 // late bytes from the failed exchange
    }
    last_opcode_    = op;
    expected_param_ = expected;
    state_          = SessionState::AwaitingResponse;
    return Status::Ok;
}

// Close the current exchange with its outcome.
Status LinkSession::finish(Status s) {
    state_ = ok(s) ? SessionState::Complete : SessionState::Failed;
    if (ok(s)) {
        if (log_enabled(LogLevel::Debug))
            log_line(LogLevel::Debug, "op=" + opcode_name(last_opcode_) + " status=ok param=" +
                                      std::to_string(expected_param_));
    } else {
        log_line(LogLevel::Warn, "op=" + opcode_name(last_opcode_) + " status=error reason=" +
                                 status_name(s) + " chan=" + channel_.name() +
                                 " state=" + session_state_name(state_));
    }
    return s;
}

Status LinkSession::transmit(const uint8_t* data, std::size_t len) {
    if (log_enabled(LogLevel::Trace))
        log_line(LogLevel::Trace, "dir=tx bytes=" + to_hex(data, len));
    return channel_.write(data, len) == IoResult::Ok ? Status::Ok : Status::IoError;
}

Status LinkSession::receive(uint8_t* out, std::size_t n) {
    switch (channel_.read_exact(out, n, opts_.response_timeout_ms)) {
        case IoResult::Ok:
            if (log_enabled(LogLevel::Trace))
                log_line(LogLevel::Trace, "dir=rx bytes=" + to_hex(out, n));
            return Status::Ok;
        case IoResult::Timeout:
            return Status::TimeoutError;
        case IoResult::Error:
            break;
    }
    return Status::IoError;
}

// ---------------------------------------------------------------------------
// await_ack()
// -----------
// Read one response header and check it echoes the pending command exactly.
// ---------------------------------------------------------------------------
Status LinkSession::await_ack() {
    Frame raw{};
    Status s = receive(raw.data(), raw.size());
    if (!ok(s)) return s;

    CommandFrame ack;
    s = decode_header(raw, ack);
    if (!ok(s)) {
        log_line(LogLevel::Warn, "op=" + opcode_name(last_opcode_) + " reason=bad_tag bytes=" +
                                 to_hex(raw));
        return s;
    }

    if (ack.role != Role::Response || ack.opcode != last_opcode_ ||
        ack.parameter != expected_param_) {
        log_line(LogLevel::Warn, "op=" + opcode_name(last_opcode_) +
                                 " reason=unexpected_ack expected_param=" +
                                 std::to_string(expected_param_) + " got=\"" + describe(ack) + "\"");
        return Status::ProtocolError;
    }
    return Status::Ok;
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

Status LinkSession::ping() {
    Status s = begin(Opcode::Ping, 0);
    if (!ok(s)) return s;

    const Frame req = encode_command(Opcode::Ping, 0);
    s = transmit(req.data(), req.size());
    if (ok(s)) s = await_ack();
    return finish(s);
}

Status LinkSession::set_count(uint16_t n) {
    Status s = begin(Opcode::SetCount, n);
    if (!ok(s)) return s;

    const Frame req = encode_command(Opcode::SetCount, n);
    s = transmit(req.data(), req.size());
    if (ok(s)) s = await_ack();
    return finish(s);
}

Status LinkSession::send_chunk(const uint32_t* entries, std::size_t count) {
    // Caller contract: checked before the exchange opens and before any write.
    if (count > max_entries_for_budget(opts_.max_frame_bytes) || (count > 0 && !entries)) {
        log_line(LogLevel::Error, "op=send_chunk reason=oversize entries=" + std::to_string(count) +
                                  " max_frame_bytes=" + std::to_string(opts_.max_frame_bytes));
        return Status::OversizeError;
    }

    const uint16_t n = static_cast<uint16_t>(count);
    Status s = begin(Opcode::SendChunk, n);
    if (!ok(s)) return s;

    // Header and payload go out as one contiguous buffer, in order.
    std::vector<uint8_t> out;
    out.reserve(FRAME_SIZE * (count + 1));
    const Frame hdr = encode_command(Opcode::SendChunk, n);
    out.insert(out.end(), hdr.begin(), hdr.end());
    for (std::size_t i = 0; i < count; ++i) append_entry(out, entries[i]);

    s = transmit(out.data(), out.size());
    if (ok(s)) s = await_ack();
    return finish(s);
}

Status LinkSession::read_last(uint32_t& out) {
    Status s = begin(Opcode::ReadLast, 0);
    if (!ok(s)) return s;

    const Frame req = encode_command(Opcode::ReadLast, 0);
    s = transmit(req.data(), req.size());
    if (ok(s)) s = await_ack();

    // The acknowledgment is followed by one untagged 4-byte entry.
    if (ok(s)) {
        Frame payload{};
        s = receive(payload.data(), payload.size());
        if (ok(s)) out = decode_entry(payload);
    }
    return finish(s);
}

} // namespace rfidlink
