#pragma once
/**
 * @file chunk_planner.hpp
 * @brief Split an identifier list into SendChunk-sized pieces and send them in order.
 *
 * The controller's receive buffer holds 255 bytes. One SendChunk is a 4-byte
 * header plus 4 bytes per entry, so the byte budget allows floor((255-4)/4)
 * entries. The firmware documents 50 entries per chunk as its limit, and the
 * chunk size is the smaller of the two.
 *
 * The plan keeps input order exactly: no sorting, no dedupe. The final chunk
 * holds the remainder; there is never an empty trailing chunk.
 *
 *   110 entries, budget 255        -> chunks of 50, 50, 10
 *   110 entries, budget 255, cap 62 -> chunks of 62, 48
 *   110 entries, budget 100        -> chunks of 24, 24, 24, 24, 14
 *   0 entries                      -> zero chunks (SetCount 0 is still sent)
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "rfidlink/frame_codec.hpp"
#include "rfidlink/link_session.hpp"
#include "rfidlink/status.hpp"

namespace rfidlink {

/// Entries per SendChunk the controller firmware is documented to accept.
static constexpr std::size_t DEVICE_MAX_CHUNK_ENTRIES = 50;

struct Chunk {
  std::vector<uint32_t> entries;
  std::size_t size() const { return entries.size(); }
};

struct UploadPlan {
  uint32_t total_count{0};
  std::size_t max_entries_per_chunk{0};
  std::vector<Chunk> chunks;
};

/**
 * @brief min(floor((max_frame_bytes - 4) / 4), max_chunk_entries).
 *
 * 0 when not even one entry fits.
 */
std::size_t max_entries_per_chunk(std::size_t max_frame_bytes = DEVICE_FRAME_BUDGET,
                                  std::size_t max_chunk_entries = DEVICE_MAX_CHUNK_ENTRIES);

/**
 * @brief Build the chunk plan for @p ids.
 *
 * @return Ok; CapacityError when ids.size() > 65535 (SetCount cannot carry it);
 *         OversizeError when the limits cannot hold a single entry or
 *         @p max_frame_bytes exceeds the device budget. @p out is only
 *         written on Ok.
 */
Status plan(const std::vector<uint32_t>& ids, UploadPlan& out,
            std::size_t max_frame_bytes = DEVICE_FRAME_BUDGET,
            std::size_t max_chunk_entries = DEVICE_MAX_CHUNK_ENTRIES);

/// Hooks consulted by send_plan(). Either may be empty.
struct ChunkHooks {
  /// Called before chunk @p index is sent; return false to stop with Aborted.
  std::function<bool(std::size_t index)> should_continue;
  /// Called after each acknowledged chunk with running totals.
  std::function<void(std::size_t acked_entries, std::size_t total)> on_progress;
};

struct SendResult {
  Status status{Status::Ok};
  std::size_t failed_chunk{0};     ///< valid when status != Ok
  std::size_t chunks_acked{0};
  std::size_t entries_acked{0};
};

/**
 * @brief Send every chunk of @p p strictly in order over @p link.
 *
 * Stops at the first failure. Cancellation is honoured only between chunks;
 * a chunk that has started is always completed or failed first.
 */
SendResult send_plan(LinkSession& link, const UploadPlan& p, const ChunkHooks& hooks = {});

} // namespace rfidlink
