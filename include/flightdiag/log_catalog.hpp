/**
 * @file log_catalog.hpp
 * @brief LogCatalog — enumerate the dataflash logs stored on the flight controller.
 *
 * @details
 * PURPOSE
 * -------
 * Before anything can be downloaded the host needs the device's roster of logs:
 * which ids exist, how big each one is, and when it was captured. LogCatalog
 * runs the "list logs" exchange over an `ILinkTransport` and returns that roster
 * as a sorted vector of `LogIndexEntry`.
 *
 * EXCHANGE
 * --------
 *   host   ListLogsRequest{0, 0xFFFF}  ------------------------------>
 *   device <---------------------------  LogEntry{id, num_logs, last_log_num, time_utc, size} x N
 *   device <---------------------------  (optional) ListLogsEnd
 *   host   RequestEnd                  ------------------------------>
 *
 * The listing ends at the first of:
 *   - an entry with `id == last_log_num` (the device's last-entry marker),
 *   - an explicit ListLogsEnd,
 *   - `num_logs` distinct entries collected.
 * A device with no logs answers with a single entry carrying `num_logs == 0`.
 *
 * FAILURE MODEL
 * -------------
 * - `NoLogsFound`:       the device reports zero logs.
 * - `MalformedResponse`: an entry cannot be valid (id 0, id past last_log_num,
 *                         inconsistent num_logs) or the roster exceeds `max_entries`.
 * - `LinkTimeout`:       no complete listing within `list_timeout_ms`, after
 *                         re-issuing the request `list_retries` times.
 * - `LinkIo`:            the transport refused every request.
 * Duplicated entries (retransmits) are ignored; entries from an earlier attempt
 * are kept, so a lossy link converges across re-requests.
 *
 * @code
 *   flightdiag::transport::SteadyClock clock;
 *   flightdiag::LogCatalog catalog(link, clock);
 *   std::vector<flightdiag::LogIndexEntry> logs;
 *   flightdiag::Error err;
 *   if (!catalog.list(logs, err)) {
 *     std::cerr << flightdiag::describe(err) << "\n";
 *   }
 * @endcode
 */
#ifndef FLIGHTDIAG_LOG_CATALOG_HPP
#define FLIGHTDIAG_LOG_CATALOG_HPP

#include <cstdint>
#include <vector>

#include "flightdiag/status.hpp"
#include "flightdiag/transport/transport_base.hpp"

namespace flightdiag {

/// One log as advertised by the device. Immutable once listed.
struct LogIndexEntry {
  uint16_t id{0};
  uint32_t size_bytes{0};
  uint32_t captured_at_utc{0};   ///< unix seconds; 0 when the device has no RTC

  bool operator==(const LogIndexEntry& o) const {
    return id == o.id && size_bytes == o.size_bytes && captured_at_utc == o.captured_at_utc;
  }
};

/// Listing policy knobs. Defaults match the overall link timeout of the CLI.
struct CatalogConfig {
  uint32_t list_timeout_ms{10000};  ///< window per listing attempt
  uint32_t list_retries{2};         ///< extra attempts after the first
  uint32_t max_entries{512};        ///< roster cap; a larger num_logs is rejected
  uint32_t poll_slice_ms{500};      ///< longest single receive() wait
  bool     verbose{false};          ///< log progress lines to std::cerr
};

/**
 * @class LogCatalog
 * @brief Runs the list-logs exchange on a borrowed transport.
 *
 * The transport and clock are owned by the caller and must outlive the catalog.
 */
class LogCatalog {
public:
  LogCatalog(transport::ILinkTransport& link, const transport::IClock& clock,
             const CatalogConfig& cfg = CatalogConfig{});

  /**
   * @brief Fetch the device's roster of logs.
   * @param out  Replaced with entries sorted by id ascending on success.
   * @param err  Filled on failure.
   * @return true on success.
   */
  bool list(std::vector<LogIndexEntry>& out, Error& err);

  const CatalogConfig& config() const { return cfg_; }

private:
  enum class Pass : uint8_t { Complete, Incomplete, Failed };

  Pass collect(std::vector<LogIndexEntry>& acc, Error& err);
  void finish();

  transport::ILinkTransport& link_;
  const transport::IClock&   clock_;
  CatalogConfig              cfg_;
  uint16_t                   expected_{0};     ///< num_logs reported by the device (0 = unknown)
  bool                       saw_tx_error_{false};
};

/// The entry with the newest capture time (ties: highest id). Requires a non-empty roster.
const LogIndexEntry& select_latest(const std::vector<LogIndexEntry>& entries);

/// Look up an entry by id; nullptr if absent.
const LogIndexEntry* find_entry(const std::vector<LogIndexEntry>& entries, uint16_t id);

} // namespace flightdiag

#endif // FLIGHTDIAG_LOG_CATALOG_HPP
