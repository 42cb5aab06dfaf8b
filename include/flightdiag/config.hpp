/**
 * @file config.hpp
 * @brief flightdiag configuration: defaults, JSON file, atomic save.
 *
 * @details
 * File location: `$XDG_CONFIG_HOME/flightdiag/config.json`, falling back to
 * `~/.config/flightdiag/config.json`. A missing file is not an error; every
 * value has a default. Unknown keys are ignored so newer files still load.
 *
 * @code
 * {
 *   "link":        { "device": "/dev/ttyACM0", "baud": 115200,
 *                    "boot_delay_ms": 400, "heartbeat_timeout_ms": 3000 },
 *   "catalog":     { "list_timeout_ms": 10000, "list_retries": 2, "max_entries": 512 },
 *   "transfer":    { "window": 4, "max_chunk_size": 90, "request_timeout_ms": 1500,
 *                    "max_backoff_ms": 8000, "max_retries_per_offset": 5,
 *                    "stall_cycle_threshold": 3, "poll_slice_ms": 100 },
 *   "diagnostics": { "language": "auto", "log_lines": 300, "rules_path": "" },
 *   "download_dir": "~/.local/share/flightdiag/logs"
 * }
 * @endcode
 *
 * A value of the wrong JSON type or outside its range fails the whole load
 * with `ConfigInvalid`; `Error::detail` names the key (e.g. "transfer.window").
 */
#ifndef FLIGHTDIAG_CONFIG_HPP
#define FLIGHTDIAG_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "flightdiag/chunked_transfer.hpp"
#include "flightdiag/knowledge_base.hpp"
#include "flightdiag/log_catalog.hpp"
#include "flightdiag/status.hpp"

namespace flightdiag {

struct LinkConfig {
  std::string device{"/dev/ttyACM0"};
  uint32_t    baud{115200};
  uint32_t    boot_delay_ms{400};          ///< settle time after open (USB CDC resets the board)
  uint32_t    heartbeat_timeout_ms{3000};  ///< wait for the vehicle heartbeat
};

struct DiagnosticsConfig {
  Language    language{Language::Auto};
  uint32_t    log_lines{300};              ///< tail of the text log to analyze
  std::string rules_path;                  ///< empty = search rules_search_path()
};

struct AppConfig {
  LinkConfig        link;
  CatalogConfig     catalog;
  TransferConfig    transfer;
  DiagnosticsConfig diagnostics;
  std::string       download_dir;          ///< empty = default_download_dir()
};

/// $XDG_CONFIG_HOME/flightdiag/config.json or ~/.config/flightdiag/config.json.
std::string default_config_path();

/// $HOME/.local/share/flightdiag/logs.
std::string default_download_dir();

/// Where an unset rules_path looks: the source tree, then the installed copy.
std::vector<std::string> rules_search_path();

/// `configured` when set; otherwise the first candidate that exists, or the
/// last one so the caller's open error names the installed location.
std::string resolve_rules_path(const std::string& configured,
                               const std::vector<std::string>& candidates = rules_search_path());

/// Overlay values from JSON text onto `cfg` (which normally holds defaults).
bool parse_config(const std::string& json_text, AppConfig& cfg, Error& err);

/// Load `path` over defaults. A missing file yields defaults and true.
bool load_config(const std::string& path, AppConfig& cfg, Error& err);

/// Write `cfg` to `path` via tmp + rename. Creates parent directories.
bool save_config(const std::string& path, const AppConfig& cfg, Error& err);

nlohmann::json to_json(const AppConfig& cfg);

} // namespace flightdiag

#endif // FLIGHTDIAG_CONFIG_HPP
