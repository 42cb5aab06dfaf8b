#pragma once
/**
 * @page fd-port-scan flightdiag Autopilot Discovery
 * @file port_scan.hpp
 * @brief Find serial ports with a MAVLink autopilot behind them.
 *
 * @details
 * PURPOSE
 * -------
 * Users rarely know whether the flight controller came up as ttyACM0 or
 * ttyACM1, and a telemetry radio adds a ttyUSB* next to it. Discovery walks
 * the candidate ports, opens each one briefly and listens for a vehicle
 * HEARTBEAT. Ports that produce one are reported online, with the vehicle's
 * system and component ids.
 *
 * CANDIDATES
 * ----------
 * - Prefer stable symlinks under `/dev/serial/by-id` (resolved to the real tty).
 * - Fall back to `/dev/ttyACM*` and `/dev/ttyUSB*` when that directory is absent.
 *
 * COST
 * ----
 * Each probe costs the boot delay plus up to the heartbeat timeout, so a scan
 * of three idle ports takes a few seconds. Nothing is cached between runs
 * except what save_port_registry() writes.
 *
 * EXAMPLE
 * -------
 * @code
 *   flightdiag::LinkConfig probe;
 *   probe.heartbeat_timeout_ms = 1500;
 *   for (const auto& p : flightdiag::discover_autopilots(probe)) {
 *       std::cout << (p.online ? "[up]   " : "[down] ") << p.dev_path << "\n";
 *   }
 * @endcode
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "flightdiag/config.hpp"
#include "flightdiag/status.hpp"

namespace flightdiag {

struct AutopilotPort {
    std::string dev_path;        /**< Canonical tty path, e.g. "/dev/ttyACM0". */
    std::string by_id;           /**< /dev/serial/by-id link, when one exists. */
    bool        online{false};   /**< True if a vehicle heartbeat arrived during the probe. */
    uint8_t     system_id{0};
    uint8_t     component_id{0};
};

/// Candidate tty paths, by-id links resolved. Second element is the by-id link (may be empty).
std::vector<std::pair<std::string, std::string>> candidate_ports();

/**
 * @brief Probe every candidate with `probe` settings (device field ignored).
 * @return One record per candidate; an empty vector means no serial ports at all.
 */
std::vector<AutopilotPort> discover_autopilots(const LinkConfig& probe, bool verbose = false);

/// First online port, or empty string.
std::string first_online(const std::vector<AutopilotPort>& ports);

/// Write the scan result as JSON (tmp + rename). Default path: ~/.config/flightdiag/ports.json.
bool save_port_registry(const std::vector<AutopilotPort>& ports, const std::string& path, Error& err);

std::string default_port_registry_path();

} // namespace flightdiag
