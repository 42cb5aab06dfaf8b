// === diagnostic_engine.cpp — implementation for diagnostic_engine.hpp
#include "flightdiag/diagnostic_engine.hpp"

#include <algorithm>

#include "flightdiag/text_util.hpp"

namespace flightdiag {

Language resolve_language(const std::string& text, Language requested) {
  if (requested != Language::Auto) return requested;
  return has_cyrillic(text) ? Language::Ru : Language::En;
}

bool DiagnosticEngine::diagnose(const std::string& text, Language language, Diagnosis& out,
                                Error& err) const {
  err.clear();
  const std::string norm = normalize_text(text);
  const Language lang = resolve_language(norm, language);

  if (index_.rule_count(lang) == 0) {
    err = make_error(ErrorCode::UnsupportedLanguage, to_string(lang));
    return false;
  }

  Diagnosis dx;
  dx.language = lang;

  if (!norm.empty()) {
    const auto& rules = index_.rules();
    for (size_t i = 0; i < rules.size(); ++i) {
      uint32_t score = 0;
      for (const auto& kw : rules[i].keywords(lang)) {
        if (norm.find(kw) != std::string::npos) ++score;
      }
      if (score > 0) dx.matches.push_back(Match{&rules[i], score, i});
    }
    // Positions are unique, so the order is total.
    std::sort(dx.matches.begin(), dx.matches.end(), [](const Match& a, const Match& b) {
      if (a.score != b.score) return a.score > b.score;
      return a.position < b.position;
    });
  }

  out = std::move(dx);
  return true;
}

bool DiagnosticEngine::diagnose_lines(const std::vector<std::string>& lines, Language language,
                                      Diagnosis& out, Error& err) const {
  return diagnose(join(lines, "\n"), language, out, err);
}

} // namespace flightdiag
