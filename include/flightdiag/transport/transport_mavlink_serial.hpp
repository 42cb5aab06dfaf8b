#pragma once
/**
 * @file transport_mavlink_serial.hpp
 * @brief ILinkTransport over a Linux TTY speaking MAVLink (LOG_* sub-protocol only).
 *
 * open() waits for the vehicle's HEARTBEAT to learn its system/component id;
 * after that a GCS heartbeat goes out once a second from inside send() and
 * receive(), which keeps ArduPilot listing logs. Inbound frames other than
 * LOG_ENTRY and LOG_DATA are parsed and dropped.
 *
 * The MAVLink C headers stay inside the .cpp.
 */

#if !defined(__linux__)
#  error "transport_mavlink_serial.hpp is Linux-only."
#endif

#include <cstdint>
#include <memory>
#include <string>

#include "flightdiag/config.hpp"
#include "flightdiag/status.hpp"
#include "flightdiag/transport/transport_base.hpp"

namespace flightdiag::transport {

class MavlinkSerialTransport : public ILinkTransport {
public:
  MavlinkSerialTransport(const IClock& clock, const LinkConfig& cfg, bool verbose = false);
  ~MavlinkSerialTransport() override;

  MavlinkSerialTransport(const MavlinkSerialTransport&) = delete;
  MavlinkSerialTransport& operator=(const MavlinkSerialTransport&) = delete;

  /// Open the port and wait for a vehicle heartbeat. LinkIo / LinkTimeout on failure.
  bool open(Error& err);
  void close();
  bool is_open() const;

  uint8_t target_system() const;
  uint8_t target_component() const;
  const std::string& device() const { return cfg_.device; }

  TxResult send(const LinkMessage& msg) override;
  RxResult receive(LinkMessage& out, uint32_t timeout_ms) override;
  const char* name() const override { return "mavlink-serial"; }

private:
  struct Impl;

  int pump(uint32_t timeout_ms);

  const IClock&         clock_;
  LinkConfig            cfg_;
  bool                  verbose_;
  std::unique_ptr<Impl> impl_;
};

} // namespace flightdiag::transport
