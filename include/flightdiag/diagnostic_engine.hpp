/**
 * @file diagnostic_engine.hpp
 * @brief DiagnosticEngine — score free text against a KnowledgeBaseIndex.
 *
 * @details
 * SCORING
 * -------
 *   1. Normalize the text (lowercase ASCII + Cyrillic, trim).
 *   2. Resolve `Language::Auto`: any Cyrillic code point means ru, else en.
 *   3. score(rule) = number of the rule's keywords in that language that occur
 *      as a substring of the normalized text.
 *   4. Keep score > 0, order by score descending, ties by catalog position.
 *
 * Deterministic and side-effect free: the same text and index always give the
 * same ranking. `diagnose()` is const and may run concurrently on one engine.
 *
 * A `Diagnosis` points into the index it was produced from; the index must
 * outlive it.
 *
 * @code
 *   flightdiag::DiagnosticEngine engine(index);
 *   flightdiag::Diagnosis dx;
 *   flightdiag::Error err;
 *   if (engine.diagnose("PreArm: RC not calibrated", flightdiag::Language::Auto, dx, err) &&
 *       !dx.empty()) {
 *     std::cout << dx.top().rule->diagnosis(dx.language) << "\n";
 *   }
 * @endcode
 */
#ifndef FLIGHTDIAG_DIAGNOSTIC_ENGINE_HPP
#define FLIGHTDIAG_DIAGNOSTIC_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "flightdiag/knowledge_base.hpp"
#include "flightdiag/status.hpp"

namespace flightdiag {

struct Match {
  const DiagnosticRule* rule{nullptr};
  uint32_t              score{0};
  size_t                position{0};   ///< index of the rule in catalog order
};

struct Diagnosis {
  std::vector<Match> matches;               ///< best first
  Language           language{Language::En};  ///< resolved, never Auto

  bool empty() const { return matches.empty(); }
  const Match& top() const { return matches.front(); }
};

/// Ru when `text` contains Cyrillic, else En. Concrete languages pass through.
Language resolve_language(const std::string& text, Language requested);

class DiagnosticEngine {
public:
  explicit DiagnosticEngine(const KnowledgeBaseIndex& index) : index_(index) {}

  /**
   * @brief Rank the index's rules against `text`.
   * @param out  Replaced with the ranked matches (possibly none).
   * @param err  UnsupportedLanguage when the resolved language has no rules.
   */
  bool diagnose(const std::string& text, Language language, Diagnosis& out, Error& err) const;

  /// Join `lines` with '\n' and diagnose them as one block.
  bool diagnose_lines(const std::vector<std::string>& lines, Language language,
                      Diagnosis& out, Error& err) const;

  const KnowledgeBaseIndex& index() const { return index_; }

private:
  const KnowledgeBaseIndex& index_;
};

} // namespace flightdiag

#endif // FLIGHTDIAG_DIAGNOSTIC_ENGINE_HPP
