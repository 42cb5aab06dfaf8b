/**
 * @file status.hpp
 * @brief flightdiag error taxonomy — stable codes plus the context needed to act on them.
 *
 * @details
 * Nothing in flightdiag throws. Every fallible call returns `bool` and fills an
 * `Error` out-parameter, so the caller can log it, retry it, or show it without
 * string-parsing a message.
 *
 * @par Taxonomy
 * - **Link-level**: `LinkTimeout`, `MalformedResponse`, `LinkIo`.
 *   Retried inside the protocol engines up to their policy limits, then surfaced.
 * - **Protocol-level**: `NoLogsFound`, `ChunkRetryExhausted`, `Stalled`, `Cancelled`.
 *   Terminal for the current operation; carry log id / offset / retry count.
 * - **Data-level**: `InvalidRule`, `UnsupportedLanguage`, `CatalogIo`, `ConfigInvalid`.
 *   Raised while loading rules or configuration, never on the scoring path
 *   (except `UnsupportedLanguage`, which only fires on an index with no rules
 *   for the requested language).
 *
 * @par Script-friendly output
 * `describe()` renders one `key=value` line in the same shape the CLIs print:
 * @code
 *   status=error reason=chunk_retry_exhausted log_id=3 offset=900 retries=5
 * @endcode
 */
#ifndef FLIGHTDIAG_STATUS_HPP
#define FLIGHTDIAG_STATUS_HPP

#include <cstdint>
#include <string>

namespace flightdiag {

/// Stable error codes. Values are never reordered; tokens come from reason().
enum class ErrorCode : uint8_t {
  None = 0,
  LinkTimeout,          ///< no response within the bounded window
  MalformedResponse,    ///< response violates the protocol (bad entry, cap exceeded)
  LinkIo,               ///< transport refused to send or reported an I/O error
  NoLogsFound,          ///< device reports zero logs
  ChunkRetryExhausted,  ///< one offset timed out max_retries_per_offset times
  Stalled,              ///< no progress across N full-window timeout cycles
  Cancelled,            ///< caller raised the cancel flag
  InvalidRule,          ///< rule record rejected at knowledge-base build time
  UnsupportedLanguage,  ///< index holds no rules for the requested language
  CatalogIo,            ///< rule catalog file missing or structurally broken
  ConfigInvalid         ///< configuration value of wrong type or out of range
};

/**
 * @brief Error value with structured context.
 *
 * Only the fields meaningful for a given code are set; the rest stay zero/empty.
 */
struct Error {
  ErrorCode   code{ErrorCode::None};
  uint16_t    log_id{0};    ///< log being listed/downloaded
  uint32_t    offset{0};    ///< byte offset that failed (transfer errors)
  uint32_t    retries{0};   ///< attempts spent at offset / list re-requests
  std::string rule_id;      ///< offending rule (InvalidRule)
  uint32_t    record{0};    ///< position of the offending rule record (InvalidRule)
  std::string detail;       ///< short machine-readable hint, e.g. "empty_keywords"

  bool ok() const { return code == ErrorCode::None; }
  void clear() { *this = Error{}; }
};

/// Stable snake_case token for a code, e.g. "link_timeout".
const char* reason(ErrorCode code);

/// One-line `status=error reason=... key=value...` rendering.
std::string describe(const Error& err);

/// Helpers used by the engines to fill an Error in one statement.
Error make_error(ErrorCode code, const std::string& detail = {});
Error make_transfer_error(ErrorCode code, uint16_t log_id, uint32_t offset, uint32_t retries);
Error make_rule_error(const std::string& rule_id, uint32_t record, const std::string& detail);

} // namespace flightdiag

#endif // FLIGHTDIAG_STATUS_HPP
