// === knowledge_base.cpp — implementation for knowledge_base.hpp
#include "flightdiag/knowledge_base.hpp"

#include "flightdiag/text_util.hpp"

namespace flightdiag {

namespace {

size_t slot(Language lang) { return lang == Language::Ru ? 0 : 1; }

Language other(Language lang) { return lang == Language::Ru ? Language::En : Language::Ru; }

const std::vector<std::string> kNoStrings;

} // namespace

const char* to_string(Language lang) {
  switch (lang) {
    case Language::Ru:   return "ru";
    case Language::En:   return "en";
    case Language::Auto: return "auto";
  }
  return "auto";
}

bool parse_language(const std::string& text, Language& out) {
  const std::string t = normalize_text(text);
  if (t == "ru")   { out = Language::Ru;   return true; }
  if (t == "en")   { out = Language::En;   return true; }
  if (t == "auto") { out = Language::Auto; return true; }
  return false;
}

const char* to_string(Severity sev) {
  switch (sev) {
    case Severity::Low:      return "low";
    case Severity::Medium:   return "medium";
    case Severity::High:     return "high";
    case Severity::Critical: return "critical";
  }
  return "medium";
}

bool parse_severity(const std::string& text, Severity& out) {
  const std::string t = normalize_text(text);
  if (t == "low")      { out = Severity::Low;      return true; }
  if (t == "medium")   { out = Severity::Medium;   return true; }
  if (t == "high")     { out = Severity::High;     return true; }
  if (t == "critical") { out = Severity::Critical; return true; }
  return false;
}

// --- DiagnosticRule --------------------------------------------------------

const std::vector<std::string>& DiagnosticRule::keywords(Language lang) const {
  if (lang == Language::Auto) return kNoStrings;
  return keywords_[slot(lang)].ordered;
}

bool DiagnosticRule::has_keyword(Language lang, const std::string& keyword) const {
  if (lang == Language::Auto) return false;
  const auto& set = keywords_[slot(lang)].lookup;
  return set.find(keyword) != set.end();
}

const std::string& DiagnosticRule::diagnosis(Language lang) const {
  if (lang == Language::Auto) lang = Language::En;
  const std::string& d = diagnosis_[slot(lang)];
  return d.empty() ? diagnosis_[slot(other(lang))] : d;
}

const std::vector<std::string>& DiagnosticRule::solution_steps(Language lang) const {
  if (lang == Language::Auto) lang = Language::En;
  const auto& s = steps_[slot(lang)];
  return s.empty() ? steps_[slot(other(lang))] : s;
}

// --- KnowledgeBaseIndex ----------------------------------------------------

// ---------------------------------------------------------------------------
// build()
// -------
// Single pass in catalog order; the first offending record stops the build.
// ---------------------------------------------------------------------------
bool KnowledgeBaseIndex::build(const std::vector<RuleRecord>& raw, KnowledgeBaseIndex& out,
                               Error& err) {
  err.clear();
  KnowledgeBaseIndex idx;
  idx.rules_.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const RuleRecord& rec = raw[i];
    const uint32_t pos = static_cast<uint32_t>(i);
    const std::string id = trim(rec.issue_id);

    if (id.empty()) {
      err = make_rule_error(rec.issue_id, pos, "empty_issue_id");
      return false;
    }
    if (idx.by_id_.count(id)) {
      err = make_rule_error(id, pos, "duplicate_issue_id");
      return false;
    }

    DiagnosticRule rule;
    rule.issue_id_ = id;
    rule.severity_ = rec.severity;

    size_t usable = 0;
    for (size_t l = 0; l < LANGUAGE_COUNT; ++l) {
      KeywordSet& ks = rule.keywords_[l];
      for (const auto& kw : rec.keywords[l]) {
        std::string norm = normalize_text(kw);
        if (norm.empty() || ks.lookup.count(norm)) continue;
        ks.lookup.insert(norm);
        ks.ordered.push_back(std::move(norm));
      }
      usable += ks.ordered.size();
      rule.diagnosis_[l] = rec.diagnosis[l];
      rule.steps_[l] = rec.solution_steps[l];
    }
    if (usable == 0) {
      err = make_rule_error(id, pos, "empty_keywords");
      return false;
    }

    rule.parameters_ = rec.parameters_to_check;
    rule.wiki_links_ = rec.wiki_links;

    for (size_t l = 0; l < LANGUAGE_COUNT; ++l) {
      if (!rule.keywords_[l].ordered.empty()) ++idx.per_language_[l];
    }
    idx.by_id_.emplace(id, idx.rules_.size());
    idx.rules_.push_back(std::move(rule));
  }

  out = std::move(idx);
  return true;
}

const DiagnosticRule* KnowledgeBaseIndex::find(const std::string& issue_id) const {
  auto it = by_id_.find(issue_id);
  return it == by_id_.end() ? nullptr : &rules_[it->second];
}

size_t KnowledgeBaseIndex::rule_count(Language lang) const {
  if (lang == Language::Auto) return 0;
  return per_language_[slot(lang)];
}

} // namespace flightdiag
