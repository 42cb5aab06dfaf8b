#include <doctest/doctest.h>
#include "flightdiag/diagnostic_engine.hpp"

using namespace flightdiag;

static RuleRecord rule(const std::string& id, std::vector<std::string> en,
                       std::vector<std::string> ru = {}) {
    RuleRecord r;
    r.issue_id = id;
    r.keywords[static_cast<size_t>(Language::En)] = std::move(en);
    r.keywords[static_cast<size_t>(Language::Ru)] = std::move(ru);
    return r;
}

static KnowledgeBaseIndex sample_index() {
    KnowledgeBaseIndex idx;
    Error err;
    bool ok = KnowledgeBaseIndex::build({
        rule("rc", {"rc not calibrated", "radio"}, {"пульт", "приёмник"}),
        rule("compass", {"compass", "compass not calibrated", "calibrated"}, {"компас"}),
        rule("imu", {"calibrated", "accel"}, {"калибров"}),
        rule("gps", {"gps"}),
    }, idx, err);
    REQUIRE(ok);
    return idx;
}

TEST_CASE("rules are ranked by keyword hits") {
    KnowledgeBaseIndex idx = sample_index();
    DiagnosticEngine engine(idx);
    Diagnosis dx;
    Error err;
    REQUIRE(engine.diagnose("PreArm: Compass not calibrated", Language::Auto, dx, err));
    CHECK(dx.language == Language::En);
    REQUIRE(dx.matches.size() == 2);
    CHECK(dx.top().rule->issue_id() == "compass");
    CHECK(dx.top().score == 3);
    CHECK(dx.matches[1].rule->issue_id() == "imu");
    CHECK(dx.matches[1].score == 1);
}

TEST_CASE("ties keep catalog order") {
    KnowledgeBaseIndex idx = sample_index();
    DiagnosticEngine engine(idx);
    Diagnosis dx;
    Error err;
    REQUIRE(engine.diagnose("radio and gps", Language::En, dx, err));
    REQUIRE(dx.matches.size() == 2);
    CHECK(dx.matches[0].rule->issue_id() == "rc");
    CHECK(dx.matches[0].position == 0);
    CHECK(dx.matches[1].rule->issue_id() == "gps");
}

TEST_CASE("Cyrillic input selects the Russian keywords") {
    KnowledgeBaseIndex idx = sample_index();
    DiagnosticEngine engine(idx);
    Diagnosis dx;
    Error err;
    REQUIRE(engine.diagnose("ПУЛЬТ не видит ПРИЁМНИК", Language::Auto, dx, err));
    CHECK(dx.language == Language::Ru);
    REQUIRE(dx.matches.size() == 1);
    CHECK(dx.top().rule->issue_id() == "rc");
    CHECK(dx.top().score == 2);
}

TEST_CASE("no match and empty text give an empty diagnosis") {
    KnowledgeBaseIndex idx = sample_index();
    DiagnosticEngine engine(idx);
    Diagnosis dx;
    Error err;
    REQUIRE(engine.diagnose("propellers look fine", Language::En, dx, err));
    CHECK(dx.empty());
    REQUIRE(engine.diagnose("   ", Language::Auto, dx, err));
    CHECK(dx.empty());
    CHECK(dx.language == Language::En);
}

TEST_CASE("a language without rules is unsupported") {
    KnowledgeBaseIndex idx;
    Error err;
    REQUIRE(KnowledgeBaseIndex::build({rule("gps", {"gps"})}, idx, err));
    DiagnosticEngine engine(idx);
    Diagnosis dx;
    CHECK_FALSE(engine.diagnose("нет gps", Language::Auto, dx, err));
    CHECK(err.code == ErrorCode::UnsupportedLanguage);
    CHECK(err.detail == "ru");
}

TEST_CASE("diagnose is deterministic and diagnose_lines joins its input") {
    KnowledgeBaseIndex idx = sample_index();
    DiagnosticEngine engine(idx);
    Diagnosis a, b, c;
    Error err;
    REQUIRE(engine.diagnose("radio\ngps", Language::En, a, err));
    REQUIRE(engine.diagnose("radio\ngps", Language::En, b, err));
    REQUIRE(engine.diagnose_lines({"radio", "gps"}, Language::En, c, err));
    REQUIRE(a.matches.size() == b.matches.size());
    REQUIRE(a.matches.size() == c.matches.size());
    for (size_t i = 0; i < a.matches.size(); ++i) {
        CHECK(a.matches[i].rule == b.matches[i].rule);
        CHECK(a.matches[i].score == c.matches[i].score);
    }
}

TEST_CASE("resolve_language passes concrete languages through") {
    CHECK(resolve_language("привет", Language::En) == Language::En);
    CHECK(resolve_language("привет", Language::Auto) == Language::Ru);
    CHECK(resolve_language("hello", Language::Auto) == Language::En);
}
