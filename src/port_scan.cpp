// ============================================================================
// port_scan.cpp — implementation for port_scan.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "port_scan.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <glob.h>             // glob(3) for tty fallbacks when /dev/serial/by-id is absent

#include "nlohmann/json.hpp"

#include "flightdiag/transport/transport_base.hpp"
#include "flightdiag/transport/transport_mavlink_serial.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace flightdiag {

/*
 * append_glob()
 * -------------
 * glob() allocates; always globfree(), even when nothing matched.
 */
static void append_glob(std::vector<std::pair<std::string, std::string>>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i], std::string());
    }
    globfree(&g);
}

std::vector<std::pair<std::string, std::string>> candidate_ports() {
    std::vector<std::pair<std::string, std::string>> out;
    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;
    if (fs::exists(by_id, ec)) {
        for (const auto& e : fs::directory_iterator(by_id, ec)) {
            if (!e.is_symlink(ec)) continue;
            auto canon = fs::canonical(e.path(), ec);
            if (!ec) out.emplace_back(canon.string(), e.path().string());
        }
    } else {
        append_glob(out, "/dev/ttyACM*");
        append_glob(out, "/dev/ttyUSB*");
    }
    return out;
}

/*
 * discover_autopilots()
 * ---------------------
 * A probe is a full transport open(): port open, boot delay, GCS heartbeat
 * out, wait for a vehicle heartbeat. Failures only mark the port offline.
 */
std::vector<AutopilotPort> discover_autopilots(const LinkConfig& probe, bool verbose) {
    std::vector<AutopilotPort> result;
    transport::SteadyClock clock;

    for (const auto& cand : candidate_ports()) {
        LinkConfig cfg = probe;
        cfg.device = cand.first;

        AutopilotPort port;
        port.dev_path = cand.first;
        port.by_id = cand.second;

        transport::MavlinkSerialTransport link(clock, cfg, verbose);
        Error err;
        if (link.open(err)) {
            port.online = true;
            port.system_id = link.target_system();
            port.component_id = link.target_component();
            link.close();
        } else if (verbose) {
            std::cerr << "event=probe dev=" << cand.first << " " << describe(err) << "\n";
        }
        result.push_back(port);
    }
    return result;
}

std::string first_online(const std::vector<AutopilotPort>& ports) {
    for (const auto& p : ports)
        if (p.online) return p.dev_path;
    return {};
}

std::string default_port_registry_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : ".") / ".config";
    return (base / "flightdiag" / "ports.json").string();
}

bool save_port_registry(const std::vector<AutopilotPort>& ports, const std::string& path, Error& err) {
    err.clear();
    json arr = json::array();
    for (const auto& p : ports) {
        arr.push_back({
            {"dev_path", p.dev_path},
            {"by_id", p.by_id},
            {"online", p.online},
            {"system_id", p.system_id},
            {"component_id", p.component_id},
        });
    }

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    if (ec) {
        err = make_error(ErrorCode::LinkIo, "registry_dir " + ec.message());
        return false;
    }
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            err = make_error(ErrorCode::LinkIo, "registry_write path=" + tmp.string());
            return false;
        }
        out << arr.dump(2) << "\n";
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        err = make_error(ErrorCode::LinkIo, "registry_rename " + ec.message());
        return false;
    }
    return true;
}

} // namespace flightdiag
