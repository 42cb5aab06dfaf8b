// -----------------------------------------------------------------------------
// log_catalog.cpp — Implementation of flightdiag::LogCatalog
//
// API & failure model: see include/flightdiag/log_catalog.hpp
// Simulated-device tests: see tests/test_log_catalog.cpp
//
// NOTE: this file is about *how* the listing converges on a lossy link:
// entries survive across attempts, the request is re-issued until the roster
// is complete or the retry budget runs out, and RequestEnd always goes out.
// -----------------------------------------------------------------------------
#include "flightdiag/log_catalog.hpp"

#include <algorithm>
#include <iostream>

namespace flightdiag {

using transport::LinkMessage;
using transport::MessageKind;
using transport::RxResult;
using transport::TxResult;

LogCatalog::LogCatalog(transport::ILinkTransport& link, const transport::IClock& clock,
                       const CatalogConfig& cfg)
: link_(link), clock_(clock), cfg_(cfg) {}

// ---------------------------------------------------------------------------
// list()
// ------
// Up to 1 + list_retries passes. Each pass sends one ListLogsRequest and
// listens until the sentinel or the pass window closes. Entries gathered in an
// incomplete pass are kept for the next one.
// ---------------------------------------------------------------------------
bool LogCatalog::list(std::vector<LogIndexEntry>& out, Error& err) {
  err.clear();
  expected_ = 0;
  saw_tx_error_ = false;

  std::vector<LogIndexEntry> acc;
  const uint32_t attempts = cfg_.list_retries + 1;

  for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (cfg_.verbose) {
      std::cerr << "event=list_request attempt=" << (attempt + 1)
                << " link=" << link_.name() << "\n";
    }

    Pass p = collect(acc, err);
    if (p == Pass::Failed) {
      finish();
      return false;
    }
    if (p == Pass::Complete) {
      finish();
      if (acc.empty()) {                        // sentinel with nothing before it
        err = make_error(ErrorCode::NoLogsFound);
        return false;
      }
      // Device order is usually ascending already; do not rely on it.
      std::stable_sort(acc.begin(), acc.end(),
                       [](const LogIndexEntry& a, const LogIndexEntry& b) { return a.id < b.id; });
      out.swap(acc);
      if (cfg_.verbose) std::cerr << "event=list_done count=" << out.size() << "\n";
      return true;
    }
  }

  finish();
  err = make_error(saw_tx_error_ && acc.empty() ? ErrorCode::LinkIo : ErrorCode::LinkTimeout,
                   acc.empty() ? "no_response" : "incomplete_listing");
  err.retries = cfg_.list_retries;
  return false;
}

// ---------------------------------------------------------------------------
// collect()
// ---------
// One listing pass. Validation happens per entry so a bad roster is reported
// as MalformedResponse with the offending id, never accumulated.
// ---------------------------------------------------------------------------
LogCatalog::Pass LogCatalog::collect(std::vector<LogIndexEntry>& acc, Error& err) {
  if (link_.send(transport::make_list_request(0, 0xFFFF)) != TxResult::Ok) {
    saw_tx_error_ = true;
    return Pass::Incomplete;                    // counts as a spent attempt
  }

  const uint64_t deadline = clock_.now_ms() + cfg_.list_timeout_ms;

  for (;;) {
    const uint64_t now = clock_.now_ms();
    if (now >= deadline) return Pass::Incomplete;

    const uint64_t left = deadline - now;
    const uint32_t wait = static_cast<uint32_t>(std::min<uint64_t>(left, cfg_.poll_slice_ms));

    LinkMessage msg;
    RxResult rx = link_.receive(msg, wait);
    if (rx != RxResult::Ok) continue;           // timeout slice or transient link error

    if (msg.kind == MessageKind::ListLogsEnd) {
      // Explicit end: complete only if nothing announced is still missing.
      if (expected_ == 0 || acc.size() >= expected_) return Pass::Complete;
      return Pass::Incomplete;
    }
    if (msg.kind != MessageKind::LogEntry) continue;   // stray LOG_DATA etc.

    const transport::LogEntryInfo& e = msg.entry;

    // POLICY: empty device
    if (e.num_logs == 0) {
      err = make_error(ErrorCode::NoLogsFound);
      return Pass::Failed;
    }

    // POLICY: roster sanity
    if (e.num_logs > cfg_.max_entries) {
      err = make_error(ErrorCode::MalformedResponse, "entry_cap");
      err.log_id = e.id;
      return Pass::Failed;
    }
    if (expected_ != 0 && e.num_logs != expected_) {
      err = make_error(ErrorCode::MalformedResponse, "num_logs_changed");
      err.log_id = e.id;
      return Pass::Failed;
    }
    if (e.id == 0 || e.id > e.last_log_num) {
      err = make_error(ErrorCode::MalformedResponse, "bad_entry_id");
      err.log_id = e.id;
      return Pass::Failed;
    }
    expected_ = e.num_logs;

    // DEDUPE: retransmitted entries
    bool dup = std::any_of(acc.begin(), acc.end(),
                           [&](const LogIndexEntry& x) { return x.id == e.id; });
    if (!dup) {
      // acc stays below expected_ <= max_entries here, so the cap holds.
      acc.push_back(LogIndexEntry{e.id, e.size, e.time_utc});
      if (cfg_.verbose) {
        std::cerr << "event=log_entry id=" << e.id << " size=" << e.size
                  << " n=" << acc.size() << "/" << e.num_logs << "\n";
      }
    }

    if (acc.size() >= expected_) return Pass::Complete;
    if (e.id == e.last_log_num) {
      // Last-entry marker arrived but earlier entries were lost on the way.
      return Pass::Incomplete;
    }
  }
}

// Always tell the device to stop listing. The roster is already decided at
// this point, so a refused RequestEnd is logged, not reported.
void LogCatalog::finish() {
  if (link_.send(transport::make_request_end()) != TxResult::Ok && cfg_.verbose) {
    std::cerr << "event=request_end_failed link=" << link_.name() << "\n";
  }
}

const LogIndexEntry& select_latest(const std::vector<LogIndexEntry>& entries) {
  return *std::max_element(entries.begin(), entries.end(),
                           [](const LogIndexEntry& a, const LogIndexEntry& b) {
                             if (a.captured_at_utc != b.captured_at_utc)
                               return a.captured_at_utc < b.captured_at_utc;
                             return a.id < b.id;
                           });
}

const LogIndexEntry* find_entry(const std::vector<LogIndexEntry>& entries, uint16_t id) {
  for (const auto& e : entries)
    if (e.id == id) return &e;
  return nullptr;
}

} // namespace flightdiag
