/**
 * @file diagnosis_report.hpp
 * @brief Render a Diagnosis for people (pretty), scripts (summary) or tools (json).
 *
 * Headings follow the diagnosis language (ru/en). Rule text is read through
 * the rule pointers; nothing is copied into the Diagnosis itself.
 */
#ifndef FLIGHTDIAG_DIAGNOSIS_REPORT_HPP
#define FLIGHTDIAG_DIAGNOSIS_REPORT_HPP

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

#include "flightdiag/diagnostic_engine.hpp"

namespace flightdiag {

/// ANSI styling that collapses to plain text when disabled.
struct Ansi {
  bool enabled{false};
  std::string bold(const std::string& s) const { return wrap("1", s); }
  std::string dim (const std::string& s) const { return wrap("2", s); }
  std::string red (const std::string& s) const { return wrap("31", s); }
  std::string wrap(const char* code, const std::string& s) const;
};

struct ReportStyle {
  bool   color{false};       ///< ANSI bold/dim/red
  size_t max_matches{3};     ///< 0 = all
};

/// Multi-line human report, best match first.
std::string render_pretty(const Diagnosis& dx, const ReportStyle& style = ReportStyle{});

/// One `key=value` line: `status=ok lang=en matches=2 top=<id> score=<n>`.
std::string render_summary(const Diagnosis& dx);

/// Structured form: {"language", "matches":[{"id","score","severity","diagnosis","solution_steps",...}]}.
nlohmann::json to_json(const Diagnosis& dx);

} // namespace flightdiag

#endif // FLIGHTDIAG_DIAGNOSIS_REPORT_HPP
