/**
 * @file main.cpp
 * @brief flightdiag-logs — list and download dataflash logs from an ArduPilot board.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11), overlay them on the JSON config file.
 *  - Resolve the device: explicit --dev, else a heartbeat scan that must find
 *    exactly one autopilot, else the configured device.
 *  - Run LogCatalog for the roster and ChunkedTransfer per selected log.
 *  - Save every finished log as log_<id>_<YYYYmmdd_HHMMSS>.bin (tmp + rename).
 *
 * Output is one `key=value` line per fact on stdout, `status=error ...` on
 * stderr. Ctrl-C cancels the running download cleanly (RequestEnd still goes out).
 *
 * Exit codes: 0 ok, 1 link/io, 2 usage/config, 3 timeout or stall,
 *             4 log not found, 5 several autopilots, 6 cancelled.
 */
#include <atomic>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>     // isatty

#include "CLI/CLI11.hpp"

#include "flightdiag/chunked_transfer.hpp"
#include "flightdiag/config.hpp"
#include "flightdiag/log_catalog.hpp"
#include "flightdiag/status.hpp"
#include "flightdiag/transport/transport_mavlink_serial.hpp"
#include "port_scan.hpp"

namespace fs = std::filesystem;
using namespace flightdiag;

static std::atomic<bool> g_cancel{false};

static void on_sigint(int) { g_cancel.store(true); }

static int exit_code(const Error& err) {
  switch (err.code) {
    case ErrorCode::None:                return 0;
    case ErrorCode::ConfigInvalid:       return 2;
    case ErrorCode::LinkTimeout:
    case ErrorCode::ChunkRetryExhausted:
    case ErrorCode::Stalled:             return 3;
    case ErrorCode::NoLogsFound:         return 4;
    case ErrorCode::Cancelled:           return 6;
    default:                             return 1;
  }
}

static std::string local_stamp() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

static std::string utc_iso(uint32_t secs) {
  if (secs == 0) return "unknown";
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static bool save_log(const fs::path& dir, const DownloadResult& res, std::string& path, Error& err) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    err = make_error(ErrorCode::LinkIo, "out_dir " + ec.message());
    return false;
  }
  const fs::path target = dir / ("log_" + std::to_string(res.entry.id) + "_" + local_stamp() + ".bin");
  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      err = make_error(ErrorCode::LinkIo, "write_failed path=" + tmp.string());
      return false;
    }
    out.write(reinterpret_cast<const char*>(res.bytes.data()),
              static_cast<std::streamsize>(res.bytes.size()));
    out.flush();
    if (!out) {
      err = make_error(ErrorCode::LinkIo, "write_failed path=" + tmp.string());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    err = make_error(ErrorCode::LinkIo, "rename_failed " + ec.message());
    return false;
  }
  path = target.string();
  return true;
}

// Progress goes to stderr every 10% (every chunk would flood a pipe).
static ProgressSink make_progress(uint16_t log_id, bool tty) {
  auto last_decile = std::make_shared<int>(-1);
  return [log_id, tty, last_decile](uint64_t got, uint32_t total) {
    const int decile = total ? static_cast<int>(got * 10 / total) : 10;
    if (decile == *last_decile) return;
    *last_decile = decile;
    std::cerr << (tty ? "\r" : "") << "progress log_id=" << log_id
              << " bytes=" << got << "/" << total << " pct=" << decile * 10
              << (tty && decile < 10 ? "" : "\n");
  };
}

int main(int argc, char** argv) {
  CLI::App app{"flightdiag-logs: list and download ArduPilot dataflash logs"};

  bool do_scan = false, do_list = false, do_latest = false, do_all = false;
  bool verbose = false, save_cfg = false;
  int  download_id = -1;
  std::string config_path = default_config_path();
  std::string dev, out_dir;
  uint32_t baud = 0, window = 0, timeout_ms = 0;

  app.add_flag("--scan", do_scan, "Probe serial ports for autopilots, save registry");
  app.add_flag("--list", do_list, "List logs stored on the board");
  app.add_option("--download", download_id, "Download log by id")->check(CLI::Range(1, 65535));
  app.add_flag("--latest", do_latest, "Download the most recent log");
  app.add_flag("--all", do_all, "Download every log");

  CLI::Option* opt_dev = app.add_option("--dev", dev, "Serial device (e.g. /dev/ttyACM0)");
  CLI::Option* opt_baud = app.add_option("--baud", baud, "Baud rate");
  CLI::Option* opt_out = app.add_option("--out-dir", out_dir, "Where .bin files are written");
  app.add_option("--config", config_path, "Config file")->capture_default_str();
  CLI::Option* opt_window = app.add_option("--window", window, "Outstanding chunk requests")
                                ->check(CLI::Range(uint32_t{1}, MAX_WINDOW));
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Chunk request timeout (ms)")
                                 ->check(CLI::Range(uint32_t{1}, uint32_t{600000}));
  app.add_flag("--verbose", verbose, "Protocol events on stderr");
  app.add_flag("--save-config", save_cfg, "Write the effective config back to --config");

  CLI11_PARSE(app, argc, argv);

  AppConfig cfg;
  Error err;
  if (!load_config(config_path, cfg, err)) {
    std::cerr << describe(err) << " path=" << config_path << "\n";
    return exit_code(err);
  }
  if (opt_dev->count())     cfg.link.device = dev;
  if (opt_baud->count())    cfg.link.baud = baud;
  if (opt_out->count())     cfg.download_dir = out_dir;
  if (opt_window->count())  cfg.transfer.window = window;
  if (opt_timeout->count()) cfg.transfer.request_timeout_ms = timeout_ms;
  if (verbose) {
    cfg.catalog.verbose = true;
    cfg.transfer.verbose = true;
  }

  if (save_cfg) {
    if (!save_config(config_path, cfg, err)) {
      std::cerr << describe(err) << "\n";
      return exit_code(err);
    }
    std::cout << "status=ok saved=" << config_path << "\n";
  }

  // -------- scan mode --------
  if (do_scan) {
    auto ports = discover_autopilots(cfg.link, verbose);
    for (const auto& p : ports) {
      std::cout << "dev=" << p.dev_path
                << " online=" << (p.online ? 1 : 0)
                << " sysid=" << int(p.system_id)
                << " compid=" << int(p.component_id);
      if (!p.by_id.empty()) std::cout << " by_id=" << p.by_id;
      std::cout << "\n";
    }
    if (!save_port_registry(ports, default_port_registry_path(), err)) {
      std::cerr << describe(err) << "\n";
      return exit_code(err);
    }
    return 0;
  }

  const int cmds = (do_list ? 1 : 0) + (download_id > 0 ? 1 : 0) + (do_latest ? 1 : 0) + (do_all ? 1 : 0);
  if (cmds != 1) {
    if (save_cfg && cmds == 0) return 0;
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // ===== Target resolution =====
  if (!opt_dev->count()) {
    auto ports = discover_autopilots(cfg.link, verbose);
    int online = 0;
    for (const auto& p : ports) online += p.online ? 1 : 0;
    if (online == 1) {
      cfg.link.device = first_online(ports);
    } else if (online > 1) {
      std::cerr << "status=error reason=multiple_autopilots need_dev\n";
      for (const auto& p : ports)
        if (p.online) std::cerr << "candidate dev=" << p.dev_path << " sysid=" << int(p.system_id) << "\n";
      return 5;
    }
    // none online: fall through to the configured device and let open() report it
  }

  transport::SteadyClock clock;
  transport::MavlinkSerialTransport link(clock, cfg.link, verbose);
  if (!link.open(err)) {
    std::cerr << describe(err) << "\n";
    return exit_code(err);
  }

  LogCatalog catalog(link, clock, cfg.catalog);
  std::vector<LogIndexEntry> logs;
  if (!catalog.list(logs, err)) {
    std::cerr << describe(err) << "\n";
    return exit_code(err);
  }

  if (do_list) {
    for (const auto& e : logs) {
      std::cout << "id=" << e.id << " size=" << e.size_bytes
                << " time=" << utc_iso(e.captured_at_utc) << "\n";
    }
    std::cout << "status=ok logs=" << logs.size() << "\n";
    return 0;
  }

  std::vector<LogIndexEntry> wanted;
  if (do_all) {
    wanted = logs;
  } else if (do_latest) {
    wanted.push_back(select_latest(logs));
  } else {
    const LogIndexEntry* e = find_entry(logs, static_cast<uint16_t>(download_id));
    if (!e) {
      std::cerr << "status=error reason=log_not_found log_id=" << download_id << "\n";
      return 4;
    }
    wanted.push_back(*e);
  }

  std::signal(SIGINT, on_sigint);
  const fs::path dir = cfg.download_dir.empty() ? fs::path(default_download_dir()) : fs::path(cfg.download_dir);
  const bool tty = ::isatty(fileno(stderr));

  ChunkedTransfer xfer(link, clock, cfg.transfer);
  size_t saved = 0;
  for (const auto& entry : wanted) {
    DownloadResult res;
    if (!xfer.download(entry, res, err, make_progress(entry.id, tty), &g_cancel)) {
      std::cerr << describe(err) << "\n";
      return exit_code(err);
    }
    std::string path;
    if (!save_log(dir, res, path, err)) {
      std::cerr << describe(err) << "\n";
      return exit_code(err);
    }
    ++saved;
    std::cout << "status=ok log_id=" << entry.id << " bytes=" << res.bytes.size()
              << " path=" << path << "\n";
  }
  if (do_all) std::cout << "status=ok downloaded=" << saved << "\n";
  return 0;
}
