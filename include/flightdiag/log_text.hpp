/**
 * @file log_text.hpp
 * @brief Scan ground-station text logs for PreArm failures and error lines.
 *
 * Line shape:
 * @code
 *   2025-12-04 10:47:49,165  INFO MissionPlanner.MainV2 - PreArm: RC not calibrated
 *   ^timestamp               ^level ^logger             ^message
 * @endcode
 * Lines that do not match are still searched for "PreArm:"; they just carry
 * the timestamp "unknown".
 */
#ifndef FLIGHTDIAG_LOG_TEXT_HPP
#define FLIGHTDIAG_LOG_TEXT_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace flightdiag {

struct LogLine {
  std::string timestamp;
  std::string level;
  std::string logger;
  std::string message;
};

struct LogFinding {
  std::string timestamp;   ///< "unknown" when the line did not parse
  std::string level;
  std::string message;
};

enum class LinkHint : unsigned char { Unknown, Connected, Disconnected };

/// Split one line into its fields. Returns false when it is not in the expected shape.
bool parse_log_line(const std::string& line, LogLine& out);

/// Every line containing "PreArm:" (any case); message is the trimmed text after the colon.
std::vector<LogFinding> find_prearm_messages(const std::vector<std::string>& lines);

/// Parsed lines whose level is one of `levels` (exact, upper case).
std::vector<LogFinding> find_errors(const std::vector<std::string>& lines,
                                    const std::vector<std::string>& levels = {"ERROR", "CRITICAL"});

/// Messages with duplicates removed, first occurrence order kept.
std::vector<std::string> unique_messages(const std::vector<LogFinding>& findings);

/// The last `n` lines of `text` (all of them when there are fewer).
std::vector<std::string> tail_lines(const std::string& text, size_t n);

/// Most recent connect/disconnect mention, scanning from the end.
LinkHint connection_hint(const std::vector<std::string>& lines);

const char* to_string(LinkHint hint);

} // namespace flightdiag

#endif // FLIGHTDIAG_LOG_TEXT_HPP
