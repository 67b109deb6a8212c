// ============================================================================
// uploader.cpp — implementation for rfidlink/uploader.hpp
// For the transaction model see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "rfidlink/uploader.hpp"
#include "rfidlink/log.hpp"

#include <chrono>
#include <sstream>
#include <thread>
#include <utility>

namespace rfidlink {

// Upper bound for one backoff wait.
static constexpr int64_t BACKOFF_CAP_MS = 60000;

const char* upload_state_name(UploadState s) {
    switch (s) {
        case UploadState::Idle:           return "idle";
        case UploadState::Pinging:        return "pinging";
        case UploadState::DeclaringCount: return "declaring_count";
        case UploadState::SendingChunks:  return "sending_chunks";
        case UploadState::Done:           return "done";
        case UploadState::Failed:         return "failed";
    }
    return "unknown";
}

const char* upload_phase_name(UploadPhase p) {
    switch (p) {
        case UploadPhase::Plan:    return "plan";
        case UploadPhase::Ping:    return "ping";
        case UploadPhase::Declare: return "declare";
        case UploadPhase::Chunk:   return "chunk";
        case UploadPhase::Done:    return "done";
    }
    return "unknown";
}

int backoff_delay_ms(const RetryPolicy& policy, int next_attempt) {
    if (next_attempt <= 1 || policy.backoff_ms <= 0) return 0;
    int64_t d = policy.backoff_ms;
    for (int i = 2; i < next_attempt && d < BACKOFF_CAP_MS; ++i)
        d *= (policy.backoff_factor < 1 ? 1 : policy.backoff_factor);
    return static_cast<int>(d < BACKOFF_CAP_MS ? d : BACKOFF_CAP_MS);
}

std::string to_kv(const UploadReport& r) {
    std::ostringstream o;
    if (ok(r.status)) o << "status=ok";
    else              o << "status=error reason=" << status_name(r.status);
    o << " phase=" << upload_phase_name(r.phase);
    if (!ok(r.status) && r.phase == UploadPhase::Chunk) o << " chunk=" << r.chunk_index;
    o << " chunks=" << r.chunks_total
      << " acked=" << r.entries_acked
      << " total=" << r.total_count
      << " attempts=" << r.attempts;
    if (!r.detail.empty()) o << " detail=" << r.detail;
    return o.str();
}

Uploader::Uploader(LinkSession& link, std::size_t max_chunk_entries)
    : link_(link), max_chunk_entries_(max_chunk_entries) {}

void Uploader::enter(UploadState s) {
    state_ = s;
    log_line(LogLevel::Info, std::string("upload_state=") + upload_state_name(s));
}

Status Uploader::fail(UploadReport& report, Status s, UploadPhase phase, std::string detail) {
    report.status = s;
    report.phase  = phase;
    report.detail = std::move(detail);
    enter(UploadState::Failed);
    return s;
}

// ---------------------------------------------------------------------------
// upload()
// --------
// One pass: plan -> ping -> declare -> chunks. No retries in here.
// ---------------------------------------------------------------------------
Status Uploader::upload(const std::vector<uint32_t>& ids, UploadReport& report) {
    const int attempts = report.attempts;
    report = UploadReport{};
    report.attempts = attempts < 1 ? 1 : attempts;
    state_ = UploadState::Idle;

    UploadPlan p;
    Status s = plan(ids, p, link_.options().max_frame_bytes, max_chunk_entries_);
    if (!ok(s)) return fail(report, s, UploadPhase::Plan, "count=" + std::to_string(ids.size()));
    report.total_count  = p.total_count;
    report.chunks_total = p.chunks.size();

    enter(UploadState::Pinging);
    s = link_.ping();
    if (!ok(s)) return fail(report, s, UploadPhase::Ping, {});

    enter(UploadState::DeclaringCount);
    s = link_.set_count(static_cast<uint16_t>(p.total_count));
    if (!ok(s)) return fail(report, s, UploadPhase::Declare, "count=" + std::to_string(p.total_count));

    enter(UploadState::SendingChunks);
    SendResult r = send_plan(link_, p, hooks_);
    report.entries_acked = r.entries_acked;
    if (!ok(r.status)) {
        report.chunk_index = r.failed_chunk;
        return fail(report, r.status, UploadPhase::Chunk,
                    "chunk_entries=" + std::to_string(p.chunks[r.failed_chunk].size()));
    }

    report.status = Status::Ok;
    report.phase  = UploadPhase::Done;
    enter(UploadState::Done);
    return Status::Ok;
}

Status Uploader::upload_with_retry(const std::vector<uint32_t>& ids, const RetryPolicy& policy,
                                   UploadReport& report, const Sleeper& sleep) {
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    report = UploadReport{};

    for (int attempt = 1; ; ++attempt) {
        report.attempts = attempt;
        Status s = upload(ids, report);
        if (ok(s) || !is_retryable(s) || attempt >= max_attempts) return s;

        const int delay = backoff_delay_ms(policy, attempt + 1);
        log_line(LogLevel::Warn, "op=upload reason=" + std::string(status_name(s)) +
                                 " retry_attempt=" + std::to_string(attempt + 1) +
                                 " of=" + std::to_string(max_attempts) +
                                 " backoff_ms=" + std::to_string(delay));
        if (delay > 0) {
            if (sleep) sleep(delay);
            else std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        // A new attempt re-declares the count, which wipes the device list.
        if (hooks_.should_continue && !hooks_.should_continue(0)) {
            log_line(LogLevel::Warn, "op=upload reason=aborted before_attempt=" +
                                     std::to_string(attempt + 1));
            report.status = Status::Aborted;
            report.detail = "before_attempt=" + std::to_string(attempt + 1);
            enter(UploadState::Failed);
            return Status::Aborted;
        }
    }
}

} // namespace rfidlink
