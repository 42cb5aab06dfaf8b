// === transport_mavlink_serial.cpp — implementation for transport_mavlink_serial.hpp
// Byte I/O via serial_io, framing via the MAVLink C library.
#include "flightdiag/transport/transport_mavlink_serial.hpp"

#include <algorithm>
#include <iostream>

#include <common/mavlink.h>

#include "etl/deque.h"

#include "serial_io.hpp"

namespace flightdiag::transport {

namespace {

// Identify as a ground station; ArduPilot only streams logs to a GCS it hears.
constexpr uint8_t  GCS_SYSTEM_ID     = 255;
constexpr uint8_t  GCS_COMPONENT_ID  = MAV_COMP_ID_MISSIONPLANNER;
constexpr uint32_t HEARTBEAT_PERIOD  = 1000;
constexpr size_t   INBOX_DEPTH       = 32;
constexpr size_t   READ_CHUNK        = 512;

} // namespace

struct MavlinkSerialTransport::Impl {
  int               fd{-1};
  mavlink_status_t  status{};
  mavlink_message_t rx{};
  bool              have_target{false};
  uint8_t           target_sys{1};
  uint8_t           target_comp{1};
  uint64_t          last_heartbeat_ms{0};
  uint32_t          dropped{0};
  etl::deque<LinkMessage, INBOX_DEPTH> inbox;
  uint8_t           buf[READ_CHUNK];
};

MavlinkSerialTransport::MavlinkSerialTransport(const IClock& clock, const LinkConfig& cfg, bool verbose)
: clock_(clock), cfg_(cfg), verbose_(verbose), impl_(std::make_unique<Impl>()) {}

MavlinkSerialTransport::~MavlinkSerialTransport() { close(); }

bool MavlinkSerialTransport::is_open() const { return impl_->fd >= 0; }
uint8_t MavlinkSerialTransport::target_system() const { return impl_->target_sys; }
uint8_t MavlinkSerialTransport::target_component() const { return impl_->target_comp; }

static bool send_frame(int fd, const mavlink_message_t& m) {
  uint8_t out[MAVLINK_MAX_PACKET_LEN];
  const uint16_t len = mavlink_msg_to_send_buffer(out, &m);
  return write_bytes(fd, out, len);
}

static bool send_heartbeat(int fd) {
  mavlink_message_t m;
  mavlink_msg_heartbeat_pack(GCS_SYSTEM_ID, GCS_COMPONENT_ID, &m,
                             MAV_TYPE_GCS, MAV_AUTOPILOT_INVALID, 0, 0, MAV_STATE_ACTIVE);
  return send_frame(fd, m);
}

// Only the device-side LOG_* messages become LinkMessages.
static bool translate(const mavlink_message_t& m, LinkMessage& out) {
  switch (m.msgid) {
    case MAVLINK_MSG_ID_LOG_ENTRY: {
      mavlink_log_entry_t e;
      mavlink_msg_log_entry_decode(&m, &e);
      LogEntryInfo info;
      info.id = e.id;
      info.num_logs = e.num_logs;
      info.last_log_num = e.last_log_num;
      info.time_utc = e.time_utc;
      info.size = e.size;
      out = make_log_entry(info);
      return true;
    }
    case MAVLINK_MSG_ID_LOG_DATA: {
      mavlink_log_data_t d;
      mavlink_msg_log_data_decode(&m, &d);
      const size_t n = std::min<size_t>(d.count, MAX_CHUNK_SIZE);
      out = make_log_data(d.id, d.ofs, d.data, n);
      return true;
    }
    default:
      return false;
  }
}

// ---------------------------------------------------------------------------
// pump()
// ------
// One bounded read, every byte through the parser. Heartbeats from a
// non-GCS source set the target; LOG_* frames land in the inbox.
// Returns -1 when the port reports an error.
// ---------------------------------------------------------------------------
int MavlinkSerialTransport::pump(uint32_t timeout_ms) {
  Impl& s = *impl_;
  const bool verbose = verbose_;
  int n = read_bytes(s.fd, s.buf, sizeof(s.buf), static_cast<int>(timeout_ms));
  if (n <= 0) return n;

  for (int i = 0; i < n; ++i) {
    if (!mavlink_parse_char(MAVLINK_COMM_0, s.buf[i], &s.rx, &s.status)) continue;

    if (s.rx.msgid == MAVLINK_MSG_ID_HEARTBEAT) {
      if (!s.have_target && mavlink_msg_heartbeat_get_type(&s.rx) != MAV_TYPE_GCS) {
        s.have_target = true;
        s.target_sys = s.rx.sysid;
        s.target_comp = s.rx.compid;
        if (verbose) {
          std::cerr << "event=heartbeat sysid=" << int(s.target_sys)
                    << " compid=" << int(s.target_comp) << "\n";
        }
      }
      continue;
    }

    LinkMessage msg;
    if (!translate(s.rx, msg)) continue;
    if (s.inbox.full()) {
      ++s.dropped;                                 // engines re-request what is lost
      if (verbose) std::cerr << "event=inbox_overflow dropped=" << s.dropped << "\n";
      continue;
    }
    s.inbox.push_back(msg);
  }
  return n;
}

bool MavlinkSerialTransport::open(Error& err) {
  err.clear();
  close();

  impl_->fd = open_serial(cfg_.device, static_cast<int>(cfg_.baud), static_cast<int>(cfg_.boot_delay_ms));
  if (impl_->fd < 0) {
    err = make_error(ErrorCode::LinkIo, "open_failed dev=" + cfg_.device);
    return false;
  }
  if (!send_heartbeat(impl_->fd)) {
    close();
    err = make_error(ErrorCode::LinkIo, "write_failed dev=" + cfg_.device);
    return false;
  }
  impl_->last_heartbeat_ms = clock_.now_ms();

  const uint64_t deadline = clock_.now_ms() + cfg_.heartbeat_timeout_ms;
  while (!impl_->have_target) {
    const uint64_t now = clock_.now_ms();
    if (now >= deadline) break;
    const uint32_t wait = static_cast<uint32_t>(std::min<uint64_t>(deadline - now, 100));
    if (pump(wait) < 0) {
      close();
      err = make_error(ErrorCode::LinkIo, "read_failed dev=" + cfg_.device);
      return false;
    }
  }

  if (!impl_->have_target) {
    close();
    err = make_error(ErrorCode::LinkTimeout, "no_heartbeat dev=" + cfg_.device);
    return false;
  }
  impl_->inbox.clear();
  return true;
}

void MavlinkSerialTransport::close() {
  if (!impl_) return;
  close_serial(impl_->fd);
  impl_->fd = -1;
  impl_->have_target = false;
  impl_->inbox.clear();
  impl_->status = mavlink_status_t{};
}

TxResult MavlinkSerialTransport::send(const LinkMessage& msg) {
  if (impl_->fd < 0) return TxResult::Error;

  const uint64_t now = clock_.now_ms();
  if (now - impl_->last_heartbeat_ms >= HEARTBEAT_PERIOD) {
    if (send_heartbeat(impl_->fd)) impl_->last_heartbeat_ms = now;
  }

  mavlink_message_t m;
  const uint8_t ts = impl_->target_sys;
  const uint8_t tc = impl_->target_comp;
  switch (msg.kind) {
    case MessageKind::ListLogsRequest:
      mavlink_msg_log_request_list_pack(GCS_SYSTEM_ID, GCS_COMPONENT_ID, &m, ts, tc,
                                        msg.list_start, msg.list_end);
      break;
    case MessageKind::ReadLogDataRequest:
      mavlink_msg_log_request_data_pack(GCS_SYSTEM_ID, GCS_COMPONENT_ID, &m, ts, tc,
                                        msg.log_id, msg.offset, msg.count);
      break;
    case MessageKind::RequestEnd:
      mavlink_msg_log_request_end_pack(GCS_SYSTEM_ID, GCS_COMPONENT_ID, &m, ts, tc);
      break;
    default:
      return TxResult::Error;                      // device-side kinds are never sent by the host
  }
  return send_frame(impl_->fd, m) ? TxResult::Ok : TxResult::Error;
}

RxResult MavlinkSerialTransport::receive(LinkMessage& out, uint32_t timeout_ms) {
  if (impl_->fd < 0) return RxResult::Error;

  const uint64_t deadline = clock_.now_ms() + timeout_ms;
  for (;;) {
    const uint64_t now = clock_.now_ms();
    if (now - impl_->last_heartbeat_ms >= HEARTBEAT_PERIOD) {
      if (send_heartbeat(impl_->fd)) impl_->last_heartbeat_ms = now;
    }
    if (!impl_->inbox.empty()) {
      out = impl_->inbox.front();
      impl_->inbox.pop_front();
      return RxResult::Ok;
    }

    const uint32_t left = now < deadline ? static_cast<uint32_t>(deadline - now) : 0;
    if (pump(std::min<uint32_t>(left, HEARTBEAT_PERIOD)) < 0) return RxResult::Error;
    if (impl_->inbox.empty() && clock_.now_ms() >= deadline) return RxResult::None;
  }
}

} // namespace flightdiag::transport
