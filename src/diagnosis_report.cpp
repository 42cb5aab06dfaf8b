// === diagnosis_report.cpp — implementation for diagnosis_report.hpp
#include "flightdiag/diagnosis_report.hpp"

#include <sstream>

namespace flightdiag {

namespace {

struct Headings {
  const char* none;
  const char* diagnosis;
  const char* solution;
  const char* parameters;
  const char* wiki;
  const char* score;
};

const Headings kEn{"No known issue matched.", "DIAGNOSIS", "SOLUTION", "RELATED PARAMETERS",
                   "WIKI", "score"};
const Headings kRu{"Известных проблем не найдено.", "ДИАГНОЗ", "РЕШЕНИЕ",
                   "СВЯЗАННЫЕ ПАРАМЕТРЫ", "ВИКИ", "совпадений"};

const Headings& headings(Language lang) { return lang == Language::Ru ? kRu : kEn; }

std::string upper_ascii(std::string s) {
  for (char& c : s) if (c >= 'a' && c <= 'z') c = char(c - 'a' + 'A');
  return s;
}

} // namespace

std::string Ansi::wrap(const char* code, const std::string& s) const {
  return enabled ? std::string("\033[") + code + "m" + s + "\033[0m" : s;
}

std::string render_pretty(const Diagnosis& dx, const ReportStyle& style) {
  const Ansi ansi{style.color};
  const Headings& h = headings(dx.language);
  std::ostringstream os;

  if (dx.empty()) {
    os << ansi.dim(h.none) << "\n";
    return os.str();
  }

  size_t shown = 0;
  for (const auto& m : dx.matches) {
    if (style.max_matches && shown == style.max_matches) break;
    const DiagnosticRule& r = *m.rule;
    if (shown) os << "\n";
    ++shown;

    std::string sev = "[" + upper_ascii(to_string(r.severity())) + "]";
    if (r.severity() == Severity::Critical || r.severity() == Severity::High) sev = ansi.red(sev);
    os << sev << " " << ansi.bold(r.issue_id())
       << ansi.dim(std::string("  (") + h.score + "=" + std::to_string(m.score) + ")") << "\n";
    os << std::string(60, '=') << "\n";

    os << ansi.bold(h.diagnosis) << ":\n  " << r.diagnosis(dx.language) << "\n";

    const auto& steps = r.solution_steps(dx.language);
    if (!steps.empty()) {
      os << ansi.bold(h.solution) << ":\n";
      for (size_t i = 0; i < steps.size(); ++i) os << "  " << (i + 1) << ". " << steps[i] << "\n";
    }
    if (!r.parameters_to_check().empty()) {
      os << ansi.bold(h.parameters) << ":\n  ";
      for (size_t i = 0; i < r.parameters_to_check().size(); ++i) {
        if (i) os << ", ";
        os << r.parameters_to_check()[i];
      }
      os << "\n";
    }
    for (const auto& link : r.wiki_links()) os << ansi.bold(h.wiki) << ": " << link << "\n";
  }

  if (shown < dx.matches.size()) {
    os << "\n" << ansi.dim("+" + std::to_string(dx.matches.size() - shown) + " more") << "\n";
  }
  return os.str();
}

std::string render_summary(const Diagnosis& dx) {
  std::ostringstream os;
  os << "status=ok lang=" << to_string(dx.language) << " matches=" << dx.matches.size();
  if (!dx.empty()) {
    os << " top=" << dx.top().rule->issue_id() << " score=" << dx.top().score
       << " severity=" << to_string(dx.top().rule->severity());
  }
  return os.str();
}

nlohmann::json to_json(const Diagnosis& dx) {
  using json = nlohmann::json;
  json j;
  j["language"] = to_string(dx.language);
  json arr = json::array();
  for (const auto& m : dx.matches) {
    const DiagnosticRule& r = *m.rule;
    json e;
    e["id"] = r.issue_id();
    e["score"] = m.score;
    e["position"] = m.position;
    e["severity"] = to_string(r.severity());
    e["diagnosis"] = r.diagnosis(dx.language);
    e["solution_steps"] = r.solution_steps(dx.language);
    e["parameters"] = r.parameters_to_check();
    e["wiki_links"] = r.wiki_links();
    arr.push_back(e);
  }
  j["matches"] = arr;
  return j;
}

} // namespace flightdiag
