// === config.cpp — implementation for config.hpp
#include "flightdiag/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

#ifndef FLIGHTDIAG_RULES_INSTALL_PATH
#define FLIGHTDIAG_RULES_INSTALL_PATH "/usr/local/share/flightdiag/rules.json"
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace flightdiag {

namespace {

bool invalid(Error& err, const std::string& key) {
  err = make_error(ErrorCode::ConfigInvalid, key);
  return false;
}

// Each reader leaves `dst` untouched when the key is absent.
bool read_u32(const json& obj, const char* section, const char* key, uint32_t& dst,
              uint32_t lo, uint32_t hi, Error& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  const std::string name = std::string(section) + "." + key;
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
    return invalid(err, name);
  }
  const uint64_t v = it->get<uint64_t>();
  if (v < lo || v > hi) return invalid(err, name);
  dst = static_cast<uint32_t>(v);
  return true;
}

bool read_str(const json& obj, const char* section, const char* key, std::string& dst, Error& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_string()) return invalid(err, std::string(section) + "." + key);
  dst = it->get<std::string>();
  return true;
}

bool read_bool(const json& obj, const char* section, const char* key, bool& dst, Error& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_boolean()) return invalid(err, std::string(section) + "." + key);
  dst = it->get<bool>();
  return true;
}

// Absent section: fine. Present but not an object: invalid.
const json* section(const json& root, const char* name, Error& err, bool& ok) {
  ok = true;
  auto it = root.find(name);
  if (it == root.end()) return nullptr;
  if (!it->is_object()) {
    ok = invalid(err, name);
    return nullptr;
  }
  return &*it;
}

constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();

bool read_link(const json& j, LinkConfig& c, Error& err) {
  return read_str(j, "link", "device", c.device, err) &&
         read_u32(j, "link", "baud", c.baud, 1, kMax, err) &&
         read_u32(j, "link", "boot_delay_ms", c.boot_delay_ms, 0, 60000, err) &&
         read_u32(j, "link", "heartbeat_timeout_ms", c.heartbeat_timeout_ms, 1, 600000, err);
}

bool read_catalog(const json& j, CatalogConfig& c, Error& err) {
  return read_u32(j, "catalog", "list_timeout_ms", c.list_timeout_ms, 1, kMax, err) &&
         read_u32(j, "catalog", "list_retries", c.list_retries, 0, 100, err) &&
         read_u32(j, "catalog", "max_entries", c.max_entries, 1, 0xFFFF, err) &&
         read_u32(j, "catalog", "poll_slice_ms", c.poll_slice_ms, 1, kMax, err) &&
         read_bool(j, "catalog", "verbose", c.verbose, err);
}

bool read_transfer(const json& j, TransferConfig& c, Error& err) {
  return read_u32(j, "transfer", "window", c.window, 1, MAX_WINDOW, err) &&
         read_u32(j, "transfer", "max_chunk_size", c.max_chunk_size, 1, MAX_CHUNK_SIZE, err) &&
         read_u32(j, "transfer", "request_timeout_ms", c.request_timeout_ms, 1, kMax, err) &&
         read_u32(j, "transfer", "max_backoff_ms", c.max_backoff_ms, 1, kMax, err) &&
         read_u32(j, "transfer", "max_retries_per_offset", c.max_retries_per_offset, 1, 1000, err) &&
         read_u32(j, "transfer", "stall_cycle_threshold", c.stall_cycle_threshold, 0, 1000, err) &&
         read_u32(j, "transfer", "poll_slice_ms", c.poll_slice_ms, 1, kMax, err) &&
         read_bool(j, "transfer", "verbose", c.verbose, err);
}

bool read_diagnostics(const json& j, DiagnosticsConfig& c, Error& err) {
  std::string lang;
  if (!read_str(j, "diagnostics", "language", lang, err)) return false;
  if (!lang.empty() && !parse_language(lang, c.language)) return invalid(err, "diagnostics.language");
  return read_u32(j, "diagnostics", "log_lines", c.log_lines, 1, 1000000, err) &&
         read_str(j, "diagnostics", "rules_path", c.rules_path, err);
}

std::string home_dir() {
  const char* home = std::getenv("HOME");
  return (home && *home) ? std::string(home) : std::string(".");
}

} // namespace

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home_dir()) / ".config";
  return (base / "flightdiag" / "config.json").string();
}

std::string default_download_dir() {
  return (fs::path(home_dir()) / ".local" / "share" / "flightdiag" / "logs").string();
}

std::vector<std::string> rules_search_path() {
  return {"knowledge/rules.json", FLIGHTDIAG_RULES_INSTALL_PATH};
}

std::string resolve_rules_path(const std::string& configured,
                               const std::vector<std::string>& candidates) {
  if (!configured.empty() || candidates.empty()) return configured;
  std::error_code ec;
  for (const auto& c : candidates) {
    if (fs::is_regular_file(c, ec)) return c;
  }
  return candidates.back();
}

bool parse_config(const std::string& json_text, AppConfig& cfg, Error& err) {
  err.clear();
  json root = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) return invalid(err, "parse_error");
  if (!root.is_object()) return invalid(err, "root");

  AppConfig next = cfg;
  bool ok = true;
  const json* s = nullptr;

  s = section(root, "link", err, ok);
  if (!ok || (s && !read_link(*s, next.link, err))) return false;
  s = section(root, "catalog", err, ok);
  if (!ok || (s && !read_catalog(*s, next.catalog, err))) return false;
  s = section(root, "transfer", err, ok);
  if (!ok || (s && !read_transfer(*s, next.transfer, err))) return false;
  s = section(root, "diagnostics", err, ok);
  if (!ok || (s && !read_diagnostics(*s, next.diagnostics, err))) return false;
  if (!read_str(root, "root", "download_dir", next.download_dir, err)) {
    err.detail = "download_dir";
    return false;
  }

  cfg = next;
  return true;
}

bool load_config(const std::string& path, AppConfig& cfg, Error& err) {
  err.clear();
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;

  std::ifstream in(path, std::ios::binary);
  if (!in) return invalid(err, "open_failed path=" + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), cfg, err)) {
    err.detail += " path=" + path;
    return false;
  }
  return true;
}

json to_json(const AppConfig& cfg) {
  json j;
  j["link"] = {
    {"device", cfg.link.device},
    {"baud", cfg.link.baud},
    {"boot_delay_ms", cfg.link.boot_delay_ms},
    {"heartbeat_timeout_ms", cfg.link.heartbeat_timeout_ms},
  };
  j["catalog"] = {
    {"list_timeout_ms", cfg.catalog.list_timeout_ms},
    {"list_retries", cfg.catalog.list_retries},
    {"max_entries", cfg.catalog.max_entries},
    {"poll_slice_ms", cfg.catalog.poll_slice_ms},
  };
  j["transfer"] = {
    {"window", cfg.transfer.window},
    {"max_chunk_size", cfg.transfer.max_chunk_size},
    {"request_timeout_ms", cfg.transfer.request_timeout_ms},
    {"max_backoff_ms", cfg.transfer.max_backoff_ms},
    {"max_retries_per_offset", cfg.transfer.max_retries_per_offset},
    {"stall_cycle_threshold", cfg.transfer.stall_cycle_threshold},
    {"poll_slice_ms", cfg.transfer.poll_slice_ms},
  };
  j["diagnostics"] = {
    {"language", to_string(cfg.diagnostics.language)},
    {"log_lines", cfg.diagnostics.log_lines},
    {"rules_path", cfg.diagnostics.rules_path},
  };
  j["download_dir"] = cfg.download_dir;
  return j;
}

bool save_config(const std::string& path, const AppConfig& cfg, Error& err) {
  err.clear();
  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  if (ec) return invalid(err, "mkdir_failed path=" + p.parent_path().string());

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return invalid(err, "write_failed path=" + tmp.string());
    out << to_json(cfg).dump(2) << "\n";
    out.flush();
    if (!out) return invalid(err, "write_failed path=" + tmp.string());
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return invalid(err, "rename_failed path=" + path);
  }
  return true;
}

} // namespace flightdiag
