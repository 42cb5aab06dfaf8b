#include <doctest/doctest.h>
#include <atomic>
#include "flightdiag/chunked_transfer.hpp"
#include "fake_device.hpp"

using namespace flightdiag;
using namespace flightdiag_test;

static LogIndexEntry entry_for(const FakeLog& log) {
    return LogIndexEntry{log.id, static_cast<uint32_t>(log.bytes.size()), log.time_utc};
}

TEST_CASE("Clean link: log arrives byte-for-byte") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(7, 1000)};

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(err.ok());
    CHECK(res.entry.id == 7);
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(xfer.last_status() == SessionStatus::Complete);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
    // 1000 bytes in 90-byte requests, nothing lost
    CHECK(dev.count_sent(MessageKind::ReadLogDataRequest) == 12);
}

TEST_CASE("Lossy link: dropped chunks are re-requested until complete") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(2, 5000)};
    dev.drop_every_nth_chunk = 3;

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(dev.count_sent(MessageKind::ReadLogDataRequest) > 56);
}

TEST_CASE("Short chunks leave a gap that is requested again") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 200)};
    dev.short_chunk_len = 40;

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(dev.count_sent(MessageKind::ReadLogDataRequest) >= 5);
    // every gap is refilled before waiting, so no request ever timed out
    CHECK(clock.now_ms() == 1000);
}

TEST_CASE("Duplicate and foreign chunks are ignored") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(4, 450)};
    dev.duplicate_chunks = true;
    const uint8_t junk[3] = {0xAA, 0xBB, 0xCC};
    dev.push_inbound(make_log_data(9, 0, junk, sizeof(junk)));

    std::vector<uint64_t> seen;
    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err,
                          [&](uint64_t got, uint32_t) { seen.push_back(got); }));
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(seen.size() == 5);                  // one call per fresh chunk
}

TEST_CASE("A dead offset exhausts its retries with the default policy") {
    uint32_t dead = 0;
    SUBCASE("first chunk") { dead = 0; }
    SUBCASE("middle chunk") { dead = 90; }
    SUBCASE("short last chunk") { dead = 450; }

    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(3, 500)};
    dev.dead_offsets = {dead};

    ChunkedTransfer xfer(dev, clock);           // retries 5, stall after 3 full-window cycles
    DownloadResult res;
    Error err;
    CHECK_FALSE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(err.code == ErrorCode::ChunkRetryExhausted);
    CHECK(err.log_id == 3);
    CHECK(err.offset == dead);
    CHECK(err.retries == 5);
    CHECK(xfer.last_status() == SessionStatus::Failed);
    CHECK(res.bytes.empty());
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
    // the first request plus four re-issues
    size_t at_dead = 0;
    for (const auto& r : dev.sent)
        if (r.msg.kind == MessageKind::ReadLogDataRequest && r.msg.offset == dead) ++at_dead;
    CHECK(at_dead == 5);
}

TEST_CASE("Re-issued requests back off exponentially up to the cap") {
    ManualClock clock;
    FakeDevice dev(clock);
    TransferConfig cfg;
    cfg.request_timeout_ms = 1000;
    cfg.max_backoff_ms = 5000;
    ChunkedTransfer xfer(dev, clock, cfg);
    CHECK(xfer.backoff_ms(0) == 1000);
    CHECK(xfer.backoff_ms(1) == 2000);
    CHECK(xfer.backoff_ms(2) == 4000);
    CHECK(xfer.backoff_ms(3) == 5000);
    CHECK(xfer.backoff_ms(30) == 5000);
}

TEST_CASE("A silent link is reported as stalled") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(5, 800)};
    dev.silent = true;

    ChunkedTransfer xfer(dev, clock);          // defaults: stall after 3 silent sweeps
    DownloadResult res;
    Error err;
    CHECK_FALSE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(err.code == ErrorCode::Stalled);
    CHECK(err.log_id == 5);
    CHECK(err.offset == 0);
    CHECK(err.retries == 3);
    CHECK(xfer.last_status() == SessionStatus::Stalled);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("The window bounds requests in flight") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 2000)};
    dev.silent = true;

    TransferConfig cfg;
    cfg.window = 3;
    const uint64_t t0 = clock.now_ms();
    ChunkedTransfer xfer(dev, clock, cfg);
    DownloadResult res;
    Error err;
    CHECK_FALSE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(dev.count_sent_at(MessageKind::ReadLogDataRequest, t0) == 3);
    CHECK(dev.sent[0].msg.offset == 0);
    CHECK(dev.sent[1].msg.offset == 90);
    CHECK(dev.sent[2].msg.offset == 180);
    CHECK(dev.sent[0].msg.count == 90);
}

TEST_CASE("Cancel stops the download at the first gap") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(6, 900)};

    std::atomic<bool> cancel{false};
    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    CHECK_FALSE(xfer.download(entry_for(dev.logs[0]), res, err,
                              [&](uint64_t, uint32_t) { cancel.store(true); }, &cancel));
    CHECK(err.code == ErrorCode::Cancelled);
    CHECK(err.offset == 90);
    CHECK(xfer.last_status() == SessionStatus::Cancelled);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("An empty log completes without reading") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(8, 0)};

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(res.bytes.empty());
    CHECK(dev.count_sent(MessageKind::ReadLogDataRequest) == 0);
    CHECK(dev.count_sent(MessageKind::RequestEnd) == 1);
}

TEST_CASE("Progress is monotonic and ends at the log size") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(2, 731)};
    dev.drop_every_nth_chunk = 4;

    std::vector<uint64_t> seen;
    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err,
                          [&](uint64_t got, uint32_t total) {
                              CHECK(total == 731);
                              seen.push_back(got);
                          }));
    REQUIRE_FALSE(seen.empty());
    for (size_t i = 1; i < seen.size(); ++i) CHECK(seen[i] > seen[i - 1]);
    CHECK(seen.back() == 731);
}

TEST_CASE("Refused sends behave like lost requests") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(1, 300)};
    dev.refuse_sends = 2;

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err));
    CHECK(res.bytes == dev.logs[0].bytes);
}

TEST_CASE("Received ranges never overlap: progress matches the distinct bytes delivered") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(3, 1234)};
    dev.drop_every_nth_chunk = 3;
    dev.duplicate_chunks = true;

    RangeSet shadow;
    dev.on_deliver = [&](const LinkMessage& m) {
        if (m.kind == MessageKind::LogData && m.log_id == 3) {
            shadow.add({m.offset, static_cast<uint32_t>(m.data.size())});
        }
        CHECK(shadow.is_canonical(1234));
    };

    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err,
                          [&](uint64_t got, uint32_t) { CHECK(got == shadow.covered_bytes()); }));
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(shadow.is_complete(1234));
}

TEST_CASE("A download restarted after cancel yields the same bytes") {
    ManualClock clock;
    FakeDevice dev(clock);
    dev.logs = {make_fake_log(6, 900)};

    std::atomic<bool> cancel{false};
    ChunkedTransfer xfer(dev, clock);
    DownloadResult res;
    Error err;
    CHECK_FALSE(xfer.download(entry_for(dev.logs[0]), res, err,
                              [&](uint64_t, uint32_t) { cancel.store(true); }, &cancel));
    REQUIRE(err.code == ErrorCode::Cancelled);
    CHECK(res.bytes.empty());

    // chunks answered for the first session are still queued on the link
    cancel.store(false);
    REQUIRE(xfer.download(entry_for(dev.logs[0]), res, err, {}, &cancel));
    CHECK(res.bytes == dev.logs[0].bytes);
    CHECK(xfer.last_status() == SessionStatus::Complete);
}
