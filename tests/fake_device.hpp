#pragma once
// Scripted flight controller for the protocol tests. Answers list and read
// requests from in-memory logs; loss, short chunks and dead offsets are knobs.
// receive() on an empty inbox advances the manual clock by the full timeout.

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <set>
#include <vector>

#include "flightdiag/transport/transport_base.hpp"

namespace flightdiag_test {

using namespace flightdiag::transport;

class ManualClock : public IClock {
public:
  uint64_t now_ms() const override { return now_; }
  void advance(uint64_t ms) { now_ += ms; }
private:
  uint64_t now_{1000};
};

struct FakeLog {
  uint16_t             id{0};
  uint32_t             time_utc{0};
  std::vector<uint8_t> bytes;
};

inline std::vector<uint8_t> pattern_bytes(uint16_t id, uint32_t size) {
  std::vector<uint8_t> v(size);
  for (uint32_t i = 0; i < size; ++i) v[i] = static_cast<uint8_t>((i * 7 + id * 13) & 0xFF);
  return v;
}

inline FakeLog make_fake_log(uint16_t id, uint32_t size, uint32_t time_utc = 0) {
  return FakeLog{id, time_utc, pattern_bytes(id, size)};
}

struct SentRecord {
  uint64_t    at_ms;
  LinkMessage msg;
};

class FakeDevice : public ILinkTransport {
public:
  explicit FakeDevice(ManualClock& clock) : clock_(clock) {}

  // --- device content ---
  std::vector<FakeLog>      logs;
  std::vector<LogEntryInfo> custom_roster;       ///< replaces the generated roster when non-empty
  bool                      report_empty{false}; ///< answer listing with num_logs == 0
  bool                      send_list_end{false};

  // --- fault knobs ---
  bool               silent{false};              ///< never answers anything
  std::set<uint16_t> drop_entry_once;            ///< roster entries lost on their first send
  uint32_t           drop_every_nth_chunk{0};    ///< 0 = lossless
  std::set<uint32_t> dead_offsets;               ///< read requests at these offsets go unanswered
  uint32_t           short_chunk_len{0};         ///< 0 = answer the full request
  bool               duplicate_chunks{false};
  uint32_t           refuse_sends{0};            ///< first N sends return TxResult::Error
  std::function<void(const LinkMessage&)> on_deliver;  ///< called for every delivered message

  // --- observations ---
  std::vector<SentRecord> sent;

  size_t count_sent(MessageKind kind) const {
    size_t n = 0;
    for (const auto& r : sent) n += r.msg.kind == kind ? 1 : 0;
    return n;
  }

  size_t count_sent_at(MessageKind kind, uint64_t at_ms) const {
    size_t n = 0;
    for (const auto& r : sent) n += (r.msg.kind == kind && r.at_ms == at_ms) ? 1 : 0;
    return n;
  }

  void push_inbound(const LinkMessage& m) { inbox_.push_back(m); }

  TxResult send(const LinkMessage& msg) override {
    sent.push_back(SentRecord{clock_.now_ms(), msg});
    if (refuse_sends) {
      --refuse_sends;
      return TxResult::Error;
    }
    if (silent) return TxResult::Ok;

    switch (msg.kind) {
      case MessageKind::ListLogsRequest: answer_list(); break;
      case MessageKind::ReadLogDataRequest: answer_read(msg); break;
      default: break;
    }
    return TxResult::Ok;
  }

  RxResult receive(LinkMessage& out, uint32_t timeout_ms) override {
    if (inbox_.empty()) {
      clock_.advance(timeout_ms);
      return RxResult::None;
    }
    out = inbox_.front();
    inbox_.pop_front();
    if (on_deliver) on_deliver(out);
    return RxResult::Ok;
  }

  const char* name() const override { return "fake"; }

private:
  const FakeLog* find_log(uint16_t id) const {
    for (const auto& l : logs)
      if (l.id == id) return &l;
    return nullptr;
  }

  void answer_list() {
    if (report_empty) {
      LogEntryInfo e;
      inbox_.push_back(make_log_entry(e));
      return;
    }
    std::vector<LogEntryInfo> roster = custom_roster;
    if (roster.empty()) {
      uint16_t last = 0;
      for (const auto& l : logs) last = l.id > last ? l.id : last;
      for (const auto& l : logs) {
        LogEntryInfo e;
        e.id = l.id;
        e.num_logs = static_cast<uint16_t>(logs.size());
        e.last_log_num = last;
        e.time_utc = l.time_utc;
        e.size = static_cast<uint32_t>(l.bytes.size());
        roster.push_back(e);
      }
    }
    for (const auto& e : roster) {
      if (drop_entry_once.erase(e.id)) continue;
      inbox_.push_back(make_log_entry(e));
    }
    if (send_list_end) inbox_.push_back(make_list_end());
  }

  void answer_read(const LinkMessage& req) {
    if (dead_offsets.count(req.offset)) return;
    const FakeLog* log = find_log(req.log_id);
    if (!log) return;

    uint32_t pos = req.offset;
    const uint32_t end = std::min<uint32_t>(req.offset + req.count, static_cast<uint32_t>(log->bytes.size()));
    while (pos < end) {
      uint32_t n = std::min<uint32_t>(end - pos, flightdiag::MAX_CHUNK_SIZE);
      if (short_chunk_len) n = std::min(n, short_chunk_len);
      ++chunk_counter_;
      const bool drop = drop_every_nth_chunk && (chunk_counter_ % drop_every_nth_chunk) == 0;
      if (!drop) {
        LinkMessage m = make_log_data(req.log_id, pos, log->bytes.data() + pos, n);
        inbox_.push_back(m);
        if (duplicate_chunks) inbox_.push_back(m);
      }
      if (short_chunk_len) break;               // short device: one chunk per request
      pos += n;
    }
  }

  ManualClock&            clock_;
  std::deque<LinkMessage> inbox_;
  uint32_t                chunk_counter_{0};
};

} // namespace flightdiag_test
