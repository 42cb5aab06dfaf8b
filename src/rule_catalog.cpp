// === rule_catalog.cpp — implementation for rule_catalog.hpp
#include "flightdiag/rule_catalog.hpp"

#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace flightdiag {

namespace {

const char* const kLangKeys[LANGUAGE_COUNT] = {"ru", "en"};   // matches Language slots

bool fail(Error& err, size_t record, const std::string& what) {
  err = make_error(ErrorCode::CatalogIo, "rule[" + std::to_string(record) + "]." + what);
  return false;
}

bool read_string_array(const json& j, std::vector<std::string>& out) {
  if (!j.is_array()) return false;
  out.clear();
  for (const auto& v : j) {
    if (!v.is_string()) return false;
    out.push_back(v.get<std::string>());
  }
  return true;
}

// Reads {"ru": <T>, "en": <T>} where each language key is optional.
template <typename T, typename Reader>
bool read_localized(const json& rule, const char* key, T (&slots)[LANGUAGE_COUNT], Reader read) {
  auto it = rule.find(key);
  if (it == rule.end()) return true;
  if (!it->is_object()) return false;
  for (size_t l = 0; l < LANGUAGE_COUNT; ++l) {
    auto v = it->find(kLangKeys[l]);
    if (v == it->end()) continue;
    if (!read(*v, slots[l])) return false;
  }
  return true;
}

bool read_text(const json& j, std::string& out) {
  if (!j.is_string()) return false;
  out = j.get<std::string>();
  return true;
}

bool read_record(const json& j, size_t i, RuleRecord& rec, Error& err) {
  if (!j.is_object()) return fail(err, i, "not_object");

  auto id = j.find("id");
  if (id != j.end()) {
    if (!id->is_string()) return fail(err, i, "id");
    rec.issue_id = id->get<std::string>();
  }

  auto sev = j.find("severity");
  if (sev != j.end()) {
    if (!sev->is_string() || !parse_severity(sev->get<std::string>(), rec.severity)) {
      return fail(err, i, "severity");
    }
  }

  if (!read_localized(j, "keywords", rec.keywords, read_string_array)) return fail(err, i, "keywords");
  if (!read_localized(j, "diagnosis", rec.diagnosis, read_text)) return fail(err, i, "diagnosis");
  if (!read_localized(j, "solution_steps", rec.solution_steps, read_string_array)) {
    return fail(err, i, "solution_steps");
  }

  auto params = j.find("parameters");
  if (params != j.end() && !read_string_array(*params, rec.parameters_to_check)) {
    return fail(err, i, "parameters");
  }
  auto links = j.find("wiki_links");
  if (links != j.end() && !read_string_array(*links, rec.wiki_links)) {
    return fail(err, i, "wiki_links");
  }
  return true;
}

} // namespace

bool parse_rule_records(const std::string& json_text, std::vector<RuleRecord>& out, Error& err) {
  err.clear();
  json root = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    err = make_error(ErrorCode::CatalogIo, "parse_error");
    return false;
  }
  if (!root.is_object()) {
    err = make_error(ErrorCode::CatalogIo, "root_not_object");
    return false;
  }
  auto rules = root.find("rules");
  if (rules == root.end() || !rules->is_array()) {
    err = make_error(ErrorCode::CatalogIo, "missing_rules_array");
    return false;
  }

  std::vector<RuleRecord> recs;
  recs.reserve(rules->size());
  for (size_t i = 0; i < rules->size(); ++i) {
    RuleRecord rec;
    if (!read_record((*rules)[i], i, rec, err)) return false;
    recs.push_back(std::move(rec));
  }
  out.swap(recs);
  return true;
}

bool load_rule_records(const std::string& path, std::vector<RuleRecord>& out, Error& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    err = make_error(ErrorCode::CatalogIo, "open_failed path=" + path);
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_rule_records(ss.str(), out, err)) {
    err.detail += " path=" + path;
    return false;
  }
  return true;
}

bool load_knowledge_base(const std::string& path, KnowledgeBaseIndex& out, Error& err) {
  std::vector<RuleRecord> recs;
  if (!load_rule_records(path, recs, err)) return false;
  return KnowledgeBaseIndex::build(recs, out, err);
}

} // namespace flightdiag
