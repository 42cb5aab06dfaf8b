/**
 * @file rule_catalog.hpp
 * @brief Read raw diagnostic rule records from a JSON catalog.
 *
 * Catalog shape:
 * @code
 * { "rules": [
 *     { "id": "rc_not_calibrated", "severity": "critical",
 *       "keywords":       { "en": ["rc not calibrated"], "ru": ["пульт не откалиброван"] },
 *       "diagnosis":      { "en": "...", "ru": "..." },
 *       "solution_steps": { "en": ["..."], "ru": ["..."] },
 *       "parameters":     ["RC1_MIN"],
 *       "wiki_links":     ["https://ardupilot.org/..."] } ] }
 * @endcode
 *
 * Only structure is checked here (types, the `rules` array, a known severity).
 * Anything wrong is reported as `CatalogIo` with a `detail` naming the record
 * and field. Semantic checks (ids, keyword presence) belong to
 * `KnowledgeBaseIndex::build()`.
 */
#ifndef FLIGHTDIAG_RULE_CATALOG_HPP
#define FLIGHTDIAG_RULE_CATALOG_HPP

#include <string>
#include <vector>

#include "flightdiag/knowledge_base.hpp"
#include "flightdiag/status.hpp"

namespace flightdiag {

/// Parse catalog JSON text. `out` is replaced on success only.
bool parse_rule_records(const std::string& json_text, std::vector<RuleRecord>& out, Error& err);

/// Read and parse a catalog file.
bool load_rule_records(const std::string& path, std::vector<RuleRecord>& out, Error& err);

/// Convenience: load a catalog file and build the index in one call.
bool load_knowledge_base(const std::string& path, KnowledgeBaseIndex& out, Error& err);

} // namespace flightdiag

#endif // FLIGHTDIAG_RULE_CATALOG_HPP
