#include <doctest/doctest.h>
#include "flightdiag/log_catalog.hpp"
#include "fake_device.hpp"

using namespace flightdiag;
using namespace flightdiag_test;

TEST_CASE("Listing three logs returns them sorted and ends the request") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(3, 300, 1700000300), make_fake_log(1, 100, 1700000100),
                make_fake_log(2, 200, 1700000200)};

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    REQUIRE(catalog.list(logs, err));
    CHECK(err.ok());
    REQUIRE(logs.size() == 3);
    CHECK(logs[0].id == 1);
    CHECK(logs[1].id == 2);
    CHECK(logs[2].id == 3);
    CHECK(logs[2].size_bytes == 300);
    CHECK(logs[0].captured_at_utc == 1700000100);

    CHECK(dev.count_sent(MessageKind::ListLogsRequest) == 1);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
    CHECK(dev.sent.front().msg.list_start == 0);
    CHECK(dev.sent.front().msg.list_end == 0xFFFF);
}

TEST_CASE("A device without logs reports NoLogsFound") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.report_empty = true;

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::NoLogsFound);
    CHECK(logs.empty());
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("A lost entry is recovered by re-requesting the list") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 10), make_fake_log(2, 20), make_fake_log(3, 30)};
    dev.drop_entry_once = {2};

    CatalogConfig cfg;
    cfg.list_timeout_ms = 2000;
    LogCatalog catalog(dev, clock, cfg);
    std::vector<LogIndexEntry> logs;
    Error err;
    REQUIRE(catalog.list(logs, err));
    REQUIRE(logs.size() == 3);
    CHECK(logs[1].id == 2);
    CHECK(dev.count_sent(MessageKind::ListLogsRequest) == 2);
}

TEST_CASE("A silent device times out after the configured retries") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.silent = true;

    CatalogConfig cfg;
    cfg.list_timeout_ms = 1000;
    cfg.list_retries = 2;
    LogCatalog catalog(dev, clock, cfg);
    std::vector<LogIndexEntry> logs;
    Error err;
    const uint64_t t0 = clock.now_ms();
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::LinkTimeout);
    CHECK(err.retries == 2);
    CHECK(dev.count_sent(MessageKind::ListLogsRequest) == 3);
    CHECK(clock.now_ms() - t0 >= 3000);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("A link that refuses every send reports LinkIo") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 10)};
    dev.refuse_sends = 100;

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::LinkIo);
}

TEST_CASE("An entry with id 0 is a malformed response") {
    ManualClock clock;
    FakeDevice dev(clock);
    LogEntryInfo bad;
    bad.id = 0;
    bad.num_logs = 1;
    bad.last_log_num = 1;
    bad.size = 10;
    dev.custom_roster = {bad};

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::MalformedResponse);
    CHECK(err.detail == "bad_entry_id");
}

static LogEntryInfo roster_entry(uint16_t id, uint16_t num_logs, uint16_t last_log_num) {
    LogEntryInfo e;
    e.id = id;
    e.num_logs = num_logs;
    e.last_log_num = last_log_num;
    e.size = 100u * id;
    return e;
}

TEST_CASE("A roster larger than the entry cap is rejected") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 10), make_fake_log(2, 20), make_fake_log(3, 30)};

    CatalogConfig cfg;
    cfg.max_entries = 2;
    LogCatalog catalog(dev, clock, cfg);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::MalformedResponse);
    CHECK(err.detail == "entry_cap");
    CHECK(err.log_id == 1);
    CHECK(logs.empty());
    CHECK(dev.count_sent(MessageKind::ListLogsRequest) == 1);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("A num_logs that changes mid-listing is rejected") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.custom_roster = {roster_entry(1, 2, 2), roster_entry(2, 3, 3)};

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::MalformedResponse);
    CHECK(err.detail == "num_logs_changed");
    CHECK(err.log_id == 2);
    CHECK(logs.empty());
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("An entry id past last_log_num is rejected") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.custom_roster = {roster_entry(1, 2, 3), roster_entry(5, 2, 3)};

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    CHECK_FALSE(catalog.list(logs, err));
    CHECK(err.code == ErrorCode::MalformedResponse);
    CHECK(err.detail == "bad_entry_id");
    CHECK(err.log_id == 5);
    CHECK(logs.empty());
}

TEST_CASE("Retransmitted entries are not duplicated and an explicit end closes the list") {
    ManualClock clock;
    FakeDevice dev(clock);
    LogEntryInfo a;
    a.id = 1; a.num_logs = 2; a.last_log_num = 2; a.size = 10;
    LogEntryInfo b = a;
    b.id = 2; b.size = 20;
    dev.custom_roster = {a, a, b};
    dev.send_list_end = true;

    LogCatalog catalog(dev, clock);
    std::vector<LogIndexEntry> logs;
    Error err;
    REQUIRE(catalog.list(logs, err));
    CHECK(logs.size() == 2);
}

TEST_CASE("select_latest prefers capture time, then the higher id") {
    std::vector<LogIndexEntry> logs = {{1, 10, 500}, {2, 10, 900}, {3, 10, 900}, {4, 10, 100}};
    CHECK(select_latest(logs).id == 3);

    std::vector<LogIndexEntry> no_rtc = {{5, 10, 0}, {7, 10, 0}, {6, 10, 0}};
    CHECK(select_latest(no_rtc).id == 7);

    REQUIRE(find_entry(logs, 2) != nullptr);
    CHECK(find_entry(logs, 2)->captured_at_utc == 900);
    CHECK(find_entry(logs, 42) == nullptr);
}
