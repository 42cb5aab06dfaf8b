// === chunked_transfer.cpp — implementation for chunked_transfer.hpp
// Windowed ranged reads, gap refill, backoff and stall detection.
// Fake-device tests: tests/test_chunked_transfer.cpp
#include "flightdiag/chunked_transfer.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace flightdiag {

using transport::LinkMessage;
using transport::MessageKind;
using transport::RxResult;
using transport::TxResult;

const char* to_string(SessionStatus s) {
  switch (s) {
    case SessionStatus::Listing:     return "listing";
    case SessionStatus::Downloading: return "downloading";
    case SessionStatus::Stalled:     return "stalled";
    case SessionStatus::Complete:    return "complete";
    case SessionStatus::Failed:      return "failed";
    case SessionStatus::Cancelled:   return "cancelled";
  }
  return "unknown";
}

ChunkedTransfer::ChunkedTransfer(transport::ILinkTransport& link, const transport::IClock& clock,
                                 const TransferConfig& cfg)
: link_(link), clock_(clock), cfg_(cfg) {
  window_ = std::min(std::max<uint32_t>(cfg_.window, 1), MAX_WINDOW);
  chunk_  = std::min(std::max<uint32_t>(cfg_.max_chunk_size, 1), MAX_CHUNK_SIZE);
}

uint32_t ChunkedTransfer::backoff_ms(uint32_t attempts) const {
  uint64_t t = cfg_.request_timeout_ms;
  for (uint32_t i = 0; i < attempts && t < cfg_.max_backoff_ms; ++i) t <<= 1;
  if (attempts > 0 && t > cfg_.max_backoff_ms) t = cfg_.max_backoff_ms;
  return static_cast<uint32_t>(t);
}

// ---------------------------------------------------------------------------
// download()
// ----------
// One cycle: cancel check -> fill window -> bounded receive -> merge -> sweep.
// ---------------------------------------------------------------------------
bool ChunkedTransfer::download(const LogIndexEntry& entry, DownloadResult& out, Error& err,
                               ProgressSink progress, const std::atomic<bool>* cancel) {
  err.clear();

  DownloadSession s;
  s.log_id = entry.id;
  s.total_size = entry.size_bytes;
  s.buffer.assign(entry.size_bytes, 0);

  if (cfg_.verbose) {
    std::cerr << "event=download_start log_id=" << s.log_id << " size=" << s.total_size
              << " window=" << window_ << " link=" << link_.name() << "\n";
  }

  for (;;) {
    if (cancel && cancel->load()) {
      finish(s, SessionStatus::Cancelled);
      auto gaps = s.received.missing(s.total_size);
      err = make_transfer_error(ErrorCode::Cancelled, s.log_id,
                                gaps.empty() ? s.total_size : gaps.front().offset, 0);
      return false;
    }

    if (s.received.is_complete(s.total_size)) break;

    fill_window(s);

    LinkMessage msg;
    RxResult rx = link_.receive(msg, receive_wait(s));
    if (rx == RxResult::Ok) {
      if (msg.kind == MessageKind::LogData) on_chunk(s, msg, progress);
    } else if (rx == RxResult::Error && cfg_.verbose) {
      std::cerr << "event=rx_error log_id=" << s.log_id << "\n";
    }

    if (!sweep(s, err)) {
      finish(s, s.status);
      return false;
    }
  }

  // Walk the ranges once more before declaring success.
  if (!s.received.is_complete(s.total_size) || !s.received.is_canonical(s.total_size)) {
    finish(s, SessionStatus::Failed);
    err = make_transfer_error(ErrorCode::MalformedResponse, s.log_id, 0, 0);
    err.detail = "reassembly";
    return false;
  }

  finish(s, SessionStatus::Complete);
  out.entry = entry;
  out.bytes.swap(s.buffer);
  if (cfg_.verbose) {
    std::cerr << "event=download_done log_id=" << s.log_id << " bytes=" << out.bytes.size() << "\n";
  }
  return true;
}

// Gaps are computed against received + in-flight, lowest offset first.
void ChunkedTransfer::fill_window(DownloadSession& s) {
  if (s.outstanding.size() >= window_) return;

  RangeSet busy = s.received;
  for (const auto& p : s.outstanding) busy.add(p.range);

  for (const auto& gap : busy.missing(s.total_size)) {
    for (const auto& piece : split_range(gap, chunk_)) {
      if (s.outstanding.size() >= window_) return;
      issue(s, piece);
    }
  }
}

// A refused send is treated like a lost request: it stays outstanding and
// the deadline sweep re-issues it.
void ChunkedTransfer::issue(DownloadSession& s, const ByteRange& r) {
  uint32_t attempts = 0;
  auto it = s.retry_count.find(r.offset);
  if (it != s.retry_count.end()) attempts = it->second;

  PendingRequest p;
  p.range = r;
  p.attempt = attempts;
  p.deadline_ms = clock_.now_ms() + backoff_ms(attempts);
  s.outstanding.push_back(p);

  TxResult tx = link_.send(transport::make_read_request(s.log_id, r.offset, r.length));
  if (tx != TxResult::Ok && cfg_.verbose) {
    std::cerr << "event=tx_failed log_id=" << s.log_id << " offset=" << r.offset
              << " result=" << static_cast<int>(tx) << "\n";
  }
}

// ---------------------------------------------------------------------------
// on_chunk()
// ----------
// Accept only chunks of this log that start inside an outstanding request.
// The chunk is clipped to that request and to the log size, merged, and the
// request retired. Whatever the chunk did not cover is a gap again.
// ---------------------------------------------------------------------------
void ChunkedTransfer::on_chunk(DownloadSession& s, const LinkMessage& msg,
                               const ProgressSink& progress) {
  const uint32_t len = std::min<uint32_t>(msg.count, static_cast<uint32_t>(msg.data.size()));
  if (msg.log_id != s.log_id || len == 0) return;

  auto req = std::find_if(s.outstanding.begin(), s.outstanding.end(),
                          [&](const PendingRequest& p) { return p.range.contains(msg.offset); });
  if (req == s.outstanding.end()) {
    if (cfg_.verbose) {
      std::cerr << "event=chunk_ignored log_id=" << s.log_id << " offset=" << msg.offset << "\n";
    }
    return;
  }

  ByteRange got = intersect(ByteRange{msg.offset, len}, req->range);
  got = intersect(got, ByteRange{0, s.total_size});
  const uint32_t req_offset = req->range.offset;
  s.outstanding.erase(req);
  if (got.empty()) return;

  std::memcpy(s.buffer.data() + got.offset, msg.data.data() + (got.offset - msg.offset), got.length);
  const uint32_t fresh = s.received.add(got);
  s.retry_count.erase(req_offset);

  if (fresh == 0) return;
  s.merged_since_sweep += fresh;
  if (progress) progress(s.received.covered_bytes(), s.total_size);
}

// ---------------------------------------------------------------------------
// sweep()
// -------
// Expired requests leave the window and count a timeout against their offset;
// fill_window() re-issues them with the longer deadline. Returns false with
// `err` set when a policy limit ends the session.
// ---------------------------------------------------------------------------
bool ChunkedTransfer::sweep(DownloadSession& s, Error& err) {
  const uint64_t now = clock_.now_ms();
  const size_t in_flight = s.outstanding.size();
  size_t expired = 0;

  for (auto it = s.outstanding.begin(); it != s.outstanding.end();) {
    if (it->deadline_ms > now) {
      ++it;
      continue;
    }
    const uint32_t offset = it->range.offset;
    const uint32_t attempts = ++s.retry_count[offset];
    ++expired;
    it = s.outstanding.erase(it);

    if (attempts >= cfg_.max_retries_per_offset) {
      s.status = SessionStatus::Failed;
      err = make_transfer_error(ErrorCode::ChunkRetryExhausted, s.log_id, offset, attempts);
      if (cfg_.verbose) std::cerr << describe(err) << "\n";
      return false;
    }
    if (cfg_.verbose) {
      std::cerr << "event=chunk_retry log_id=" << s.log_id << " offset=" << offset
                << " attempt=" << attempts << " backoff_ms=" << backoff_ms(attempts) << "\n";
    }
  }

  if (expired == 0) return true;

  // A stall cycle is a full window timing out with nothing merged since the
  // last sweep. A partial window (e.g. one dead offset near the end) only
  // spends per-offset retries; only merged bytes clear the stall count.
  if (s.merged_since_sweep > 0) {
    s.stall_cycles = 0;
  } else if (in_flight == window_ && expired == in_flight) {
    ++s.stall_cycles;
    if (cfg_.verbose) {
      std::cerr << "event=stall_cycle log_id=" << s.log_id << " n=" << s.stall_cycles << "\n";
    }
  }
  s.merged_since_sweep = 0;

  if (cfg_.stall_cycle_threshold != 0 && s.stall_cycles >= cfg_.stall_cycle_threshold) {
    s.status = SessionStatus::Stalled;
    auto gaps = s.received.missing(s.total_size);
    err = make_transfer_error(ErrorCode::Stalled, s.log_id,
                              gaps.empty() ? 0 : gaps.front().offset, s.stall_cycles);
    return false;
  }
  return true;
}

// Time left to the earliest deadline, never more than one poll slice.
uint32_t ChunkedTransfer::receive_wait(const DownloadSession& s) const {
  uint64_t wait = cfg_.poll_slice_ms;
  const uint64_t now = clock_.now_ms();
  for (const auto& p : s.outstanding) {
    const uint64_t left = p.deadline_ms > now ? p.deadline_ms - now : 0;
    wait = std::min(wait, left);
  }
  return static_cast<uint32_t>(wait);
}

void ChunkedTransfer::finish(DownloadSession& s, SessionStatus status) {
  s.status = status;
  s.outstanding.clear();
  last_status_ = status;
  if (link_.send(transport::make_request_end()) != TxResult::Ok && cfg_.verbose) {
    std::cerr << "event=request_end_failed log_id=" << s.log_id << "\n";
  }
}

} // namespace flightdiag
