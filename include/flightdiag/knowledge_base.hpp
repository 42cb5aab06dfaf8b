/**
 * @file knowledge_base.hpp
 * @brief KnowledgeBaseIndex — validated, per-language index of diagnostic rules.
 *
 * @details
 * PURPOSE
 * -------
 * Rule catalogs arrive as loosely checked `RuleRecord`s (see rule_catalog.hpp).
 * `KnowledgeBaseIndex::build()` validates them once and turns each into an
 * immutable `DiagnosticRule` whose keywords are already normalized, so the
 * scoring path never lowercases or trims a keyword again.
 *
 * VALIDATION
 * ----------
 * A record is rejected with `InvalidRule{rule_id, record}` when
 *   - its issue id is empty or already used by an earlier record, or
 *   - it has no usable keyword in any supported language (ru, en).
 * Keywords are lowercased (ASCII + Cyrillic) and trimmed; empty ones and
 * duplicates inside one language are dropped silently.
 *
 * LAYOUT
 * ------
 * Rules keep catalog order. Per rule and language the keywords are stored
 * twice: an ordered vector for scanning and an unordered_set for O(1)
 * membership. After `build()` the index is read-only and safe to share
 * between threads.
 */
#ifndef FLIGHTDIAG_KNOWLEDGE_BASE_HPP
#define FLIGHTDIAG_KNOWLEDGE_BASE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "flightdiag/status.hpp"

namespace flightdiag {

/// Supported rule languages; Auto is resolved by the engine, never stored.
enum class Language : uint8_t { Ru = 0, En = 1, Auto = 2 };

static constexpr size_t LANGUAGE_COUNT = 2;   ///< Ru and En

const char* to_string(Language lang);
/// Accepts "ru", "en", "auto" (any case). Returns false for anything else.
bool parse_language(const std::string& text, Language& out);

enum class Severity : uint8_t { Low, Medium, High, Critical };

const char* to_string(Severity sev);
bool parse_severity(const std::string& text, Severity& out);

/// Raw rule as read from a catalog; nothing is normalized yet.
struct RuleRecord {
  std::string              issue_id;
  Severity                 severity{Severity::Medium};
  std::vector<std::string> keywords[LANGUAGE_COUNT];
  std::string              diagnosis[LANGUAGE_COUNT];
  std::vector<std::string> solution_steps[LANGUAGE_COUNT];
  std::vector<std::string> parameters_to_check;
  std::vector<std::string> wiki_links;
};

struct KeywordSet {
  std::vector<std::string>        ordered;
  std::unordered_set<std::string> lookup;
};

/// Validated rule. Only KnowledgeBaseIndex::build() creates these.
class DiagnosticRule {
public:
  const std::string& issue_id() const { return issue_id_; }
  Severity severity() const { return severity_; }

  /// Normalized keywords for a concrete language (Ru or En).
  const std::vector<std::string>& keywords(Language lang) const;
  /// `keyword` must already be normalized.
  bool has_keyword(Language lang, const std::string& keyword) const;

  /// Text in `lang`, falling back to the other language when empty.
  const std::string& diagnosis(Language lang) const;
  const std::vector<std::string>& solution_steps(Language lang) const;

  const std::vector<std::string>& parameters_to_check() const { return parameters_; }
  const std::vector<std::string>& wiki_links() const { return wiki_links_; }

private:
  friend class KnowledgeBaseIndex;

  std::string              issue_id_;
  Severity                 severity_{Severity::Medium};
  KeywordSet               keywords_[LANGUAGE_COUNT];
  std::string              diagnosis_[LANGUAGE_COUNT];
  std::vector<std::string> steps_[LANGUAGE_COUNT];
  std::vector<std::string> parameters_;
  std::vector<std::string> wiki_links_;
};

class KnowledgeBaseIndex {
public:
  /**
   * @brief Validate `raw` and build an index.
   * @param out  Replaced on success, untouched on failure.
   * @param err  InvalidRule with the offending id and record position.
   */
  static bool build(const std::vector<RuleRecord>& raw, KnowledgeBaseIndex& out, Error& err);

  const std::vector<DiagnosticRule>& rules() const { return rules_; }
  const DiagnosticRule* find(const std::string& issue_id) const;

  /// Rules with at least one keyword in `lang` (Ru or En; Auto yields 0).
  size_t rule_count(Language lang) const;

  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

private:
  std::vector<DiagnosticRule>             rules_;
  std::unordered_map<std::string, size_t> by_id_;
  size_t                                  per_language_[LANGUAGE_COUNT]{0, 0};
};

} // namespace flightdiag

#endif // FLIGHTDIAG_KNOWLEDGE_BASE_HPP
