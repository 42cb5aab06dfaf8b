/**
 * @file text_util.hpp
 * @brief Small UTF-8 text helpers shared by the knowledge base, the engine and the log scanner.
 *
 * Case folding covers exactly what the rule catalogs use: ASCII and the
 * Cyrillic block (U+0400..U+04FF). Everything else passes through unchanged,
 * including malformed byte sequences.
 */
#ifndef FLIGHTDIAG_TEXT_UTIL_HPP
#define FLIGHTDIAG_TEXT_UTIL_HPP

#include <string>
#include <vector>

namespace flightdiag {

/// Lowercase ASCII and Cyrillic letters in a UTF-8 string.
std::string to_lower_utf8(const std::string& s);

/// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string& s);

/// Lowercase then trim; the canonical keyword/text form.
std::string normalize_text(const std::string& s);

/// True if any code point falls in U+0400..U+04FF.
bool has_cyrillic(const std::string& s);

/// ASCII case-insensitive search; npos when absent.
std::string::size_type find_icase(const std::string& haystack, const std::string& needle);

/// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

/// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace flightdiag

#endif // FLIGHTDIAG_TEXT_UTIL_HPP
