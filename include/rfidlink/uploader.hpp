#pragma once
/**
 * @page rl-uploader rfidlink Upload Orchestrator
 * @file uploader.hpp
 * @brief The single "upload list" transaction: ping, declare count, send every chunk.
 *
 * @details
 * STATE MACHINE
 * -------------
 *   Idle -> Pinging -> DeclaringCount -> SendingChunks -> Done
 *      \________\______________\_______________\-----> Failed
 *
 * 1. The plan is built while Idle. A list over 65535 entries fails here with
 *    CapacityError and the channel is never touched.
 * 2. Pinging: ping(). Failure stops everything.
 * 3. DeclaringCount: set_count(total). Failure means no chunk is sent.
 * 4. SendingChunks: send_chunk() per planned chunk, strictly in order. The
 *    first failure aborts the whole upload.
 * 5. Done only after every chunk acknowledgment validated.
 *
 * The device has no resume primitive. A failed upload is restarted from Idle:
 * count declared again, every chunk sent again. upload_with_retry() does that
 * for the caller under a bounded RetryPolicy.
 *
 * CANCELLATION
 * ------------
 * ChunkHooks::should_continue is asked before each chunk, and by
 * upload_with_retry() before each further attempt (with index 0, the chunk
 * that attempt would start from). Returning false ends the upload with
 * Aborted. A chunk already on the wire is never cut, and a cancelled retry
 * never re-declares the count.
 *
 * REPORTING
 * ---------
 * UploadReport names the phase that failed (plan, ping, declare, chunk), the
 * chunk index for chunk failures, and how far the upload got.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "rfidlink/chunk_planner.hpp"
#include "rfidlink/link_session.hpp"
#include "rfidlink/status.hpp"

namespace rfidlink {

enum class UploadState : uint8_t { Idle, Pinging, DeclaringCount, SendingChunks, Done, Failed };

enum class UploadPhase : uint8_t { Plan, Ping, Declare, Chunk, Done };

const char* upload_state_name(UploadState s);
const char* upload_phase_name(UploadPhase p);

struct RetryPolicy {
  int max_attempts{1};      ///< total attempts, >= 1
  int backoff_ms{500};      ///< wait before the second attempt
  int backoff_factor{2};    ///< multiplier applied for each further attempt
};

/// Delay before attempt @p next_attempt (2-based); 0 for the first attempt.
int backoff_delay_ms(const RetryPolicy& policy, int next_attempt);

using Sleeper = std::function<void(int ms)>;

struct UploadReport {
  Status      status{Status::Ok};
  UploadPhase phase{UploadPhase::Plan};   ///< phase reached (failed phase when status != Ok)
  std::size_t chunk_index{0};             ///< failing chunk when phase == Chunk
  std::size_t chunks_total{0};
  std::size_t entries_acked{0};
  uint32_t    total_count{0};
  int         attempts{0};
  std::string detail;
};

/// "status=error reason=timeout phase=chunk chunk=2 chunks=3 acked=100 total=110 attempts=1".
std::string to_kv(const UploadReport& r);

class Uploader {
public:
  explicit Uploader(LinkSession& link, std::size_t max_chunk_entries = DEVICE_MAX_CHUNK_ENTRIES);

  void set_hooks(ChunkHooks hooks) { hooks_ = std::move(hooks); }

  /// One attempt through the state machine. Returns report.status.
  /// report.attempts is kept from the caller, or 1 when unset.
  Status upload(const std::vector<uint32_t>& ids, UploadReport& report);

  /**
   * @brief Repeat upload() from Idle until success or the policy is spent.
   *
   * Only retryable statuses (see is_retryable()) trigger another attempt.
   * @p sleep defaults to std::this_thread::sleep_for.
   */
  Status upload_with_retry(const std::vector<uint32_t>& ids, const RetryPolicy& policy,
                           UploadReport& report, const Sleeper& sleep = {});

  UploadState state() const { return state_; }

private:
  Status fail(UploadReport& report, Status s, UploadPhase phase, std::string detail);
  void   enter(UploadState s);

  LinkSession& link_;
  std::size_t  max_chunk_entries_;
  ChunkHooks   hooks_;
  UploadState  state_{UploadState::Idle};
};

} // namespace rfidlink
