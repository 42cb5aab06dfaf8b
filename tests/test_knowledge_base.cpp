#include <doctest/doctest.h>
#include "flightdiag/knowledge_base.hpp"

using namespace flightdiag;

static RuleRecord rule(const std::string& id, std::vector<std::string> en,
                       std::vector<std::string> ru = {}) {
    RuleRecord r;
    r.issue_id = id;
    r.keywords[static_cast<size_t>(Language::En)] = std::move(en);
    r.keywords[static_cast<size_t>(Language::Ru)] = std::move(ru);
    return r;
}

TEST_CASE("build keeps catalog order and normalizes keywords") {
    std::vector<RuleRecord> raw = {
        rule("rc", {"RC Not Calibrated", "  Radio "}, {"Пульт"}),
        rule("gps", {"GPS", "gps"}),
    };
    KnowledgeBaseIndex idx;
    Error err;
    REQUIRE(KnowledgeBaseIndex::build(raw, idx, err));
    REQUIRE(idx.size() == 2);
    CHECK(idx.rules()[0].issue_id() == "rc");
    CHECK(idx.rules()[1].issue_id() == "gps");

    const DiagnosticRule* rc = idx.find("rc");
    REQUIRE(rc != nullptr);
    CHECK(rc->keywords(Language::En) == std::vector<std::string>{"rc not calibrated", "radio"});
    CHECK(rc->has_keyword(Language::Ru, "пульт"));
    CHECK_FALSE(rc->has_keyword(Language::Auto, "radio"));

    // duplicate keyword after normalization collapses
    CHECK(idx.find("gps")->keywords(Language::En).size() == 1);

    CHECK(idx.rule_count(Language::En) == 2);
    CHECK(idx.rule_count(Language::Ru) == 1);
    CHECK(idx.rule_count(Language::Auto) == 0);
    CHECK(idx.find("missing") == nullptr);
}

TEST_CASE("build rejects an empty issue id") {
    std::vector<RuleRecord> raw = {rule("ok", {"a"}), rule("   ", {"b"})};
    KnowledgeBaseIndex idx;
    Error err;
    CHECK_FALSE(KnowledgeBaseIndex::build(raw, idx, err));
    CHECK(err.code == ErrorCode::InvalidRule);
    CHECK(err.record == 1);
    CHECK(err.detail == "empty_issue_id");
    CHECK(idx.empty());
}

TEST_CASE("build rejects duplicate ids and rules without keywords") {
    KnowledgeBaseIndex idx;
    Error err;

    std::vector<RuleRecord> dup = {rule("gps", {"gps"}), rule("gps", {"satellite"})};
    CHECK_FALSE(KnowledgeBaseIndex::build(dup, idx, err));
    CHECK(err.code == ErrorCode::InvalidRule);
    CHECK(err.rule_id == "gps");
    CHECK(err.detail == "duplicate_issue_id");

    std::vector<RuleRecord> bare = {rule("empty", {"  ", ""})};
    CHECK_FALSE(KnowledgeBaseIndex::build(bare, idx, err));
    CHECK(err.rule_id == "empty");
    CHECK(err.record == 0);
    CHECK(err.detail == "empty_keywords");
}

TEST_CASE("a failed build leaves the previous index untouched") {
    KnowledgeBaseIndex idx;
    Error err;
    REQUIRE(KnowledgeBaseIndex::build({rule("a", {"x"})}, idx, err));
    CHECK_FALSE(KnowledgeBaseIndex::build({rule("", {"y"})}, idx, err));
    REQUIRE(idx.size() == 1);
    CHECK(idx.rules()[0].issue_id() == "a");
}

TEST_CASE("text falls back to the other language") {
    RuleRecord r = rule("batt", {"battery"}, {"батарея"});
    r.diagnosis[static_cast<size_t>(Language::En)] = "Battery low";
    r.solution_steps[static_cast<size_t>(Language::Ru)] = {"Зарядите батарею"};
    KnowledgeBaseIndex idx;
    Error err;
    REQUIRE(KnowledgeBaseIndex::build({r}, idx, err));
    const DiagnosticRule& d = idx.rules()[0];
    CHECK(d.diagnosis(Language::Ru) == "Battery low");
    CHECK(d.solution_steps(Language::En).size() == 1);
}

TEST_CASE("language and severity tokens") {
    Language lang = Language::En;
    CHECK(parse_language("RU", lang));
    CHECK(lang == Language::Ru);
    CHECK_FALSE(parse_language("de", lang));
    CHECK(std::string(to_string(Language::Auto)) == "auto");

    Severity sev = Severity::Low;
    CHECK(parse_severity("Critical", sev));
    CHECK(sev == Severity::Critical);
    CHECK_FALSE(parse_severity("urgent", sev));
}
