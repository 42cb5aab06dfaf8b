/**
 * @file chunked_transfer.hpp
 * @brief ChunkedTransfer — download one dataflash log byte-for-byte over a lossy link.
 *
 * @details
 * PURPOSE
 * -------
 * The device streams a log as 90-byte LOG_DATA chunks in answer to ranged
 * read requests. Chunks get lost, arrive short, or arrive for a request the
 * host already gave up on. ChunkedTransfer keeps a small window of ranged
 * requests in flight, merges whatever arrives into a `RangeSet`, and re-asks
 * for the holes until the log is complete or a policy limit is hit.
 *
 * SESSION STATE
 * -------------
 *   Downloading --(all bytes merged)-----------------------------> Complete
 *        |      --(one offset timed out max_retries times)-------> Failed
 *        |      --(stall_cycle_threshold silent full sweeps)-----> Stalled
 *        |      --(cancel flag raised)---------------------------> Cancelled
 *
 * One `DownloadSession` lives for the duration of a single `download()` call.
 * RequestEnd goes out after every terminal state so the device stops streaming.
 *
 * POLICY
 * ------
 * - window: outstanding requests, default 4, clamped to [1, MAX_WINDOW].
 * - request_timeout_ms: deadline of a first request; a re-issue waits
 *   `request_timeout_ms << attempts`, capped at `max_backoff_ms`.
 * - max_retries_per_offset: timeouts at one offset before ChunkRetryExhausted.
 * - stall_cycle_threshold: timeout sweeps in which a full window expired and
 *   nothing was merged, without merged bytes in between; 0 disables stall detection.
 * - poll_slice_ms: upper bound of a single receive() wait.
 *
 * A short chunk retires its request; the uncovered remainder becomes a gap and
 * is re-requested by the next window fill, before any wait.
 *
 * @code
 *   flightdiag::ChunkedTransfer xfer(link, clock);
 *   flightdiag::DownloadResult result;
 *   flightdiag::Error err;
 *   bool ok = xfer.download(entry, result, err,
 *       [](uint64_t got, uint32_t total) { std::cerr << got << "/" << total << "\n"; });
 * @endcode
 */
#ifndef FLIGHTDIAG_CHUNKED_TRANSFER_HPP
#define FLIGHTDIAG_CHUNKED_TRANSFER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "etl/vector.h"

#include "flightdiag/chunk_codec.hpp"
#include "flightdiag/log_catalog.hpp"
#include "flightdiag/status.hpp"
#include "flightdiag/transport/transport_base.hpp"

namespace flightdiag {

/// Hard cap on requests in flight; sizes the session's outstanding list.
static constexpr uint32_t MAX_WINDOW = 16;

struct TransferConfig {
  uint32_t max_chunk_size{MAX_CHUNK_SIZE};
  uint32_t window{4};
  uint32_t request_timeout_ms{1500};
  uint32_t max_backoff_ms{8000};
  uint32_t max_retries_per_offset{5};
  uint32_t stall_cycle_threshold{3};
  uint32_t poll_slice_ms{100};
  bool     verbose{false};
};

enum class SessionStatus : uint8_t { Listing, Downloading, Stalled, Complete, Failed, Cancelled };

const char* to_string(SessionStatus s);

/// One ranged read in flight.
struct PendingRequest {
  ByteRange range;
  uint64_t  deadline_ms{0};
  uint32_t  attempt{0};     ///< timeouts already spent at range.offset
};

/**
 * @brief Bookkeeping for a single download() call.
 *
 * `received` stays canonical (sorted, merged, inside [0, total_size)) and
 * `status == Complete` only when it is exactly [0, total_size).
 */
struct DownloadSession {
  uint16_t                                 log_id{0};
  uint32_t                                 total_size{0};
  RangeSet                                 received;
  etl::vector<PendingRequest, MAX_WINDOW>  outstanding;
  std::map<uint32_t, uint32_t>             retry_count;   ///< offset -> timeouts
  SessionStatus                            status{SessionStatus::Downloading};
  std::vector<uint8_t>                     buffer;        ///< reassembly, total_size bytes
  uint32_t                                 stall_cycles{0};
  uint64_t                                 merged_since_sweep{0};
};

/// Fully reassembled log. Writing it to disk is the caller's job.
struct DownloadResult {
  LogIndexEntry        entry;
  std::vector<uint8_t> bytes;
};

/// Called after every merge that added bytes: (bytes_received, total_size).
using ProgressSink = std::function<void(uint64_t, uint32_t)>;

class ChunkedTransfer {
public:
  ChunkedTransfer(transport::ILinkTransport& link, const transport::IClock& clock,
                  const TransferConfig& cfg = TransferConfig{});

  /**
   * @brief Download `entry` completely.
   * @param out       Filled with the entry and its bytes on success only.
   * @param err       ChunkRetryExhausted, Stalled or Cancelled on failure.
   * @param progress  Optional progress callback.
   * @param cancel    Optional cooperative cancel flag, checked once per cycle.
   * @return true when the whole log was received.
   */
  bool download(const LogIndexEntry& entry, DownloadResult& out, Error& err,
                ProgressSink progress = {}, const std::atomic<bool>* cancel = nullptr);

  /// Terminal status of the most recent download() call.
  SessionStatus last_status() const { return last_status_; }

  const TransferConfig& config() const { return cfg_; }

  /// Deadline offset for a request that already timed out `attempts` times.
  uint32_t backoff_ms(uint32_t attempts) const;

private:
  void fill_window(DownloadSession& s);
  void issue(DownloadSession& s, const ByteRange& r);
  void on_chunk(DownloadSession& s, const transport::LinkMessage& msg, const ProgressSink& progress);
  bool sweep(DownloadSession& s, Error& err);
  uint32_t receive_wait(const DownloadSession& s) const;
  void finish(DownloadSession& s, SessionStatus status);

  transport::ILinkTransport& link_;
  const transport::IClock&   clock_;
  TransferConfig             cfg_;
  uint32_t                   window_;
  uint32_t                   chunk_;
  SessionStatus              last_status_{SessionStatus::Listing};
};

} // namespace flightdiag

#endif // FLIGHTDIAG_CHUNKED_TRANSFER_HPP
