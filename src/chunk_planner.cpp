// ============================================================================
// chunk_planner.cpp — implementation for rfidlink/chunk_planner.hpp
// ============================================================================

#include "rfidlink/chunk_planner.hpp"
#include "rfidlink/log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace rfidlink {

std::size_t max_entries_per_chunk(std::size_t max_frame_bytes, std::size_t max_chunk_entries) {
    return std::min(max_entries_for_budget(max_frame_bytes), max_chunk_entries);
}

Status plan(const std::vector<uint32_t>& ids, UploadPlan& out, std::size_t max_frame_bytes,
            std::size_t max_chunk_entries) {
    if (ids.size() > MAX_PARAMETER) {
        log_line(LogLevel::Error, "op=plan reason=capacity count=" + std::to_string(ids.size()) +
                                  " max=" + std::to_string(MAX_PARAMETER));
        return Status::CapacityError;
    }

    const std::size_t per = max_entries_per_chunk(max_frame_bytes, max_chunk_entries);
    if (per == 0 || max_frame_bytes > DEVICE_FRAME_BUDGET) {
        log_line(LogLevel::Error, "op=plan reason=oversize max_frame_bytes=" +
                                  std::to_string(max_frame_bytes) + " max_chunk_entries=" +
                                  std::to_string(max_chunk_entries));
        return Status::OversizeError;
    }

    UploadPlan p;
    p.total_count = static_cast<uint32_t>(ids.size());
    p.max_entries_per_chunk = per;
    p.chunks.reserve((ids.size() + per - 1) / per);

    for (std::size_t i = 0; i < ids.size(); i += per) {
        const std::size_t n = std::min(per, ids.size() - i);
        Chunk c;
        c.entries.assign(ids.begin() + static_cast<std::ptrdiff_t>(i),
                         ids.begin() + static_cast<std::ptrdiff_t>(i + n));
        p.chunks.push_back(std::move(c));
    }

    out = std::move(p);
    return Status::Ok;
}

SendResult send_plan(LinkSession& link, const UploadPlan& p, const ChunkHooks& hooks) {
    SendResult r;
    for (std::size_t i = 0; i < p.chunks.size(); ++i) {
        if (hooks.should_continue && !hooks.should_continue(i)) {
            log_line(LogLevel::Warn, "op=send_plan reason=aborted next_chunk=" + std::to_string(i));
            r.status = Status::Aborted;
            r.failed_chunk = i;
            return r;
        }

        const Chunk& c = p.chunks[i];
        Status s = link.send_chunk(c.entries);
        if (!ok(s)) {
            r.status = s;
            r.failed_chunk = i;
            return r;
        }

        r.chunks_acked += 1;
        r.entries_acked += c.size();
        if (hooks.on_progress) hooks.on_progress(r.entries_acked, p.total_count);
    }
    return r;
}

} // namespace rfidlink
