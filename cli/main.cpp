/**
 * @file main.cpp
 * @brief flightdiag CLI — match a question or a ground-station log against the rule catalog.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); load config and the rule catalog (JSON).
 *  - `--ask <text>`: diagnose free text ("PreArm: RC not calibrated", "не армится").
 *  - `--scan-log <file>`: take the last N lines of a text log, collect PreArm and
 *    ERROR/CRITICAL messages, diagnose them together.
 *  - Render as pretty text (ANSI on a tty), a one-line summary, or JSON.
 *
 * Notes:
 *  - `--lang auto` picks ru when the input contains Cyrillic.
 *  - Exactly one of --ask / --scan-log per run.
 *  - Exit codes: 0 ok (with or without matches), 1 io, 2 usage/config/catalog.
 */

#include <cstdio>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "flightdiag/config.hpp"
#include "flightdiag/diagnosis_report.hpp"
#include "flightdiag/diagnostic_engine.hpp"
#include "flightdiag/knowledge_base.hpp"
#include "flightdiag/log_text.hpp"
#include "flightdiag/rule_catalog.hpp"
#include "flightdiag/status.hpp"

using json = nlohmann::json;
using namespace flightdiag;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

static bool read_text_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static json findings_json(const std::vector<LogFinding>& v) {
  json a = json::array();
  for (const auto& f : v) a.push_back({{"timestamp", f.timestamp}, {"level", f.level}, {"message", f.message}});
  return a;
}

static void print_findings(const char* title, const std::vector<LogFinding>& v, const Ansi& ansi) {
  std::cout << ansi.bold(std::string(title) + " (" + std::to_string(v.size()) + ")") << "\n";
  for (const auto& f : v) std::cout << "  " << ansi.dim(f.timestamp) << "  " << f.message << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_ask;
  std::string opt_scan_log;
  uint32_t    opt_lines = 0;
  std::string opt_lang;
  std::string opt_rules;
  std::string opt_format = "pretty"; // pretty|summary|json
  std::string opt_config = default_config_path();
  bool        opt_no_color = false;
  size_t      opt_max = 3;

  CLI::App app{"flightdiag: diagnose ArduPilot problems from text or a log"};

  app.add_option("--ask", opt_ask, "Describe the problem (ru/en)");
  app.add_option("--scan-log", opt_scan_log, "Ground-station text log to scan");
  CLI::Option* o_lines = app.add_option("--lines", opt_lines, "Tail of the log to scan")
                             ->check(CLI::Range(uint32_t{1}, uint32_t{1000000}));
  CLI::Option* o_lang = app.add_option("--lang", opt_lang, "ru|en|auto")
                            ->check(CLI::IsMember({"ru", "en", "auto"}));
  CLI::Option* o_rules = app.add_option("--rules", opt_rules, "Rule catalog JSON");
  app.add_option("--format", opt_format, "Output format: pretty|summary|json")
      ->check(CLI::IsMember({"pretty", "summary", "json"}));
  app.add_option("--config", opt_config, "Config file")->capture_default_str();
  app.add_option("--max", opt_max, "Matches shown in pretty output (0 = all)")->capture_default_str();
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const int cmds = (opt_ask.empty() ? 0 : 1) + (opt_scan_log.empty() ? 0 : 1);
  if (cmds != 1) {
    std::cerr << "status=error reason=need_ask_or_scan_log\n";
    return 2;
  }

  AppConfig cfg;
  Error err;
  if (!load_config(opt_config, cfg, err)) {
    std::cerr << describe(err) << " path=" << opt_config << "\n";
    return 2;
  }
  Language lang = cfg.diagnostics.language;
  if (o_lang->count() && !parse_language(opt_lang, lang)) {
    std::cerr << "status=error reason=bad_lang lang=" << opt_lang << "\n";
    return 2;
  }
  const uint32_t lines = o_lines->count() ? opt_lines : cfg.diagnostics.log_lines;
  const std::string rules_path =
      o_rules->count() ? opt_rules : resolve_rules_path(cfg.diagnostics.rules_path);

  KnowledgeBaseIndex index;
  if (!load_knowledge_base(rules_path, index, err)) {
    std::cerr << describe(err) << "\n";
    return 2;
  }
  DiagnosticEngine engine(index);

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";
  ReportStyle style;
  style.color = ansi.enabled;
  style.max_matches = opt_max;

  Diagnosis dx;

  // -------- free text --------
  if (!opt_ask.empty()) {
    if (!engine.diagnose(opt_ask, lang, dx, err)) {
      std::cerr << describe(err) << "\n";
      return 2;
    }
    if (opt_format == "json")         std::cout << to_json(dx).dump(2) << "\n";
    else if (opt_format == "summary") std::cout << render_summary(dx) << "\n";
    else                              std::cout << render_pretty(dx, style);
    return 0;
  }

  // -------- log scan --------
  std::string text;
  if (!read_text_file(opt_scan_log, text)) {
    std::cerr << "status=error reason=open_failed path=" << opt_scan_log << "\n";
    return 1;
  }
  const auto tail = tail_lines(text, lines);
  const auto prearm = find_prearm_messages(tail);
  const auto errors = find_errors(tail);
  const LinkHint hint = connection_hint(tail);

  // PreArm text carries the diagnosis; error lines only help when there is none.
  std::vector<std::string> evidence = unique_messages(prearm);
  if (evidence.empty()) evidence = unique_messages(errors);
  if (!evidence.empty() && !engine.diagnose_lines(evidence, lang, dx, err)) {
    std::cerr << describe(err) << "\n";
    return 2;
  }
  if (evidence.empty()) dx.language = resolve_language(text, lang);

  if (opt_format == "json") {
    json j;
    j["log"] = {
      {"path", opt_scan_log},
      {"lines_scanned", tail.size()},
      {"link", to_string(hint)},
      {"prearm", findings_json(prearm)},
      {"errors", findings_json(errors)},
    };
    j["diagnosis"] = to_json(dx);
    std::cout << j.dump(2) << "\n";
  } else if (opt_format == "summary") {
    std::cout << "log=" << opt_scan_log << " lines=" << tail.size()
              << " prearm=" << prearm.size() << " errors=" << errors.size()
              << " link=" << to_string(hint) << "\n";
    std::cout << render_summary(dx) << "\n";
  } else {
    std::cout << ansi.dim("scanned " + std::to_string(tail.size()) + " lines, link " + to_string(hint)) << "\n\n";
    print_findings("PreArm", prearm, ansi);
    print_findings("Errors", errors, ansi);
    std::cout << "\n" << render_pretty(dx, style);
  }
  return 0;
}
