#pragma once
/**
 * @file transport_base.hpp
 * @brief Link boundary for the log sub-protocol: structured messages, transport trait, clock.
 *
 * The protocol engines never see bytes. A transport (MAVLink over serial in
 * production, a scripted fake in tests) turns wire frames into `LinkMessage`
 * values and back. Header-only on purpose.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "flightdiag/chunk_codec.hpp"

namespace flightdiag::transport {

// Return codes kept simple so wrappers map errno/driver states without ceremony.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };   // None == timed out

/// Log sub-protocol message kinds (MAVLink LOG_* family, conceptually).
enum class MessageKind : uint8_t {
  ListLogsRequest = 0,  ///< host -> device: enumerate logs in [start, end]
  LogEntry,             ///< device -> host: one catalog entry
  ListLogsEnd,          ///< device -> host: explicit end of listing (optional on the wire)
  ReadLogDataRequest,   ///< host -> device: send `count` bytes of `log_id` from `offset`
  LogData,              ///< device -> host: one chunk
  RequestEnd            ///< host -> device: stop any listing/streaming
};

/// Fields of one LOG_ENTRY as reported by the device.
struct LogEntryInfo {
  uint16_t id{0};
  uint16_t num_logs{0};
  uint16_t last_log_num{0};
  uint32_t time_utc{0};
  uint32_t size{0};
};

/**
 * @brief One structured protocol message.
 *
 * Flat on purpose: only the fields that belong to `kind` are meaningful.
 */
struct LinkMessage {
  MessageKind  kind{MessageKind::RequestEnd};

  // ListLogsRequest
  uint16_t     list_start{0};
  uint16_t     list_end{0xFFFF};

  // LogEntry
  LogEntryInfo entry;

  // ReadLogDataRequest / LogData
  uint16_t     log_id{0};
  uint32_t     offset{0};
  uint32_t     count{0};      ///< requested bytes (request) or valid bytes (data)
  ChunkBytes   data;          ///< LogData payload, data.size() == count
};

inline LinkMessage make_list_request(uint16_t start = 0, uint16_t end = 0xFFFF) {
  LinkMessage m;
  m.kind = MessageKind::ListLogsRequest;
  m.list_start = start;
  m.list_end = end;
  return m;
}

inline LinkMessage make_log_entry(const LogEntryInfo& e) {
  LinkMessage m;
  m.kind = MessageKind::LogEntry;
  m.entry = e;
  return m;
}

inline LinkMessage make_list_end() {
  LinkMessage m;
  m.kind = MessageKind::ListLogsEnd;
  return m;
}

inline LinkMessage make_read_request(uint16_t log_id, uint32_t offset, uint32_t count) {
  LinkMessage m;
  m.kind = MessageKind::ReadLogDataRequest;
  m.log_id = log_id;
  m.offset = offset;
  m.count = count;
  return m;
}

// Payload longer than MAX_CHUNK_SIZE is truncated; the wire cannot carry more.
inline LinkMessage make_log_data(uint16_t log_id, uint32_t offset, const uint8_t* bytes, std::size_t len) {
  LinkMessage m;
  m.kind = MessageKind::LogData;
  m.log_id = log_id;
  m.offset = offset;
  if (len > MAX_CHUNK_SIZE) len = MAX_CHUNK_SIZE;
  if (bytes && len) m.data.assign(bytes, bytes + len);
  m.count = static_cast<uint32_t>(m.data.size());
  return m;
}

inline LinkMessage make_request_end() {
  LinkMessage m;
  m.kind = MessageKind::RequestEnd;
  return m;
}

/**
 * @brief Transport trait the protocol engines rely on.
 *
 * Contract:
 *  - send(msg) hands one message to the link; never blocks for long.
 *  - receive(out, timeout_ms) waits at most timeout_ms for the next inbound
 *    message; RxResult::None means the wait expired with nothing to deliver.
 *  - One engine drives one transport at a time; the link is exclusive.
 */
class ILinkTransport {
public:
  virtual ~ILinkTransport() = default;
  virtual TxResult    send(const LinkMessage& msg) = 0;
  virtual RxResult    receive(LinkMessage& out, uint32_t timeout_ms) = 0;
  virtual const char* name() const = 0;
};

/// Millisecond time source; injected so deadline logic runs against a fake in tests.
class IClock {
public:
  virtual ~IClock() = default;
  virtual uint64_t now_ms() const = 0;
};

/// Production clock: monotonic, unaffected by wall-clock jumps.
class SteadyClock : public IClock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
  }
};

} // namespace flightdiag::transport
