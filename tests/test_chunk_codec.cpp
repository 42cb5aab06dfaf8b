#include <doctest/doctest.h>
#include "flightdiag/chunk_codec.hpp"

using namespace flightdiag;

TEST_CASE("RangeSet merges touching and overlapping ranges") {
    RangeSet rs;
    CHECK(rs.add({0, 90}) == 90);
    CHECK(rs.add({180, 90}) == 90);
    REQUIRE(rs.ranges().size() == 2);

    // fills the hole exactly; both neighbours touch it
    CHECK(rs.add({90, 90}) == 90);
    REQUIRE(rs.ranges().size() == 1);
    CHECK(rs.ranges()[0] == ByteRange{0, 270});
    CHECK(rs.is_canonical(270));
    CHECK(rs.is_complete(270));
}

TEST_CASE("RangeSet::add reports only new bytes") {
    RangeSet rs;
    rs.add({10, 20});          // [10,30)
    rs.add({50, 10});          // [50,60)
    CHECK(rs.add({20, 40}) == 20);   // [20,60): 10 + 10 already there
    CHECK(rs.covered_bytes() == 50);
    CHECK(rs.add({15, 5}) == 0);
    CHECK(rs.add({0, 0}) == 0);
    CHECK(rs.ranges().size() == 1);
}

TEST_CASE("RangeSet::missing lists holes inside the total") {
    RangeSet rs;
    rs.add({0, 90});
    rs.add({180, 90});
    auto holes = rs.missing(300);
    REQUIRE(holes.size() == 2);
    CHECK(holes[0] == ByteRange{90, 90});
    CHECK(holes[1] == ByteRange{270, 30});

    RangeSet none;
    auto all = none.missing(42);
    REQUIRE(all.size() == 1);
    CHECK(all[0] == ByteRange{0, 42});
    CHECK(none.missing(0).empty());
}

TEST_CASE("RangeSet covers and contains") {
    RangeSet rs;
    rs.add({100, 50});
    CHECK(rs.covers({100, 50}));
    CHECK(rs.covers({120, 10}));
    CHECK_FALSE(rs.covers({90, 20}));
    CHECK_FALSE(rs.covers({140, 20}));
    CHECK(rs.contains(149));
    CHECK_FALSE(rs.contains(150));
    CHECK_FALSE(rs.contains(99));
}

TEST_CASE("is_complete and is_canonical edge cases") {
    RangeSet rs;
    CHECK(rs.is_complete(0));
    CHECK_FALSE(rs.is_complete(1));

    rs.add({0, 100});
    CHECK_FALSE(rs.is_complete(101));
    CHECK_FALSE(rs.is_canonical(50));     // exceeds the log size
    CHECK(rs.is_canonical(100));

    rs.clear();
    CHECK(rs.empty());
}

TEST_CASE("split_range cuts a gap into request-sized pieces") {
    auto parts = split_range({10, 200}, 90);
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == ByteRange{10, 90});
    CHECK(parts[1] == ByteRange{100, 90});
    CHECK(parts[2] == ByteRange{190, 20});

    CHECK(split_range({0, 0}, 90).empty());
    CHECK(split_range({0, 10}, 0).empty());
}

TEST_CASE("intersect") {
    CHECK(intersect({0, 10}, {5, 10}) == ByteRange{5, 5});
    CHECK(intersect({0, 10}, {10, 10}).empty());
    CHECK(intersect({20, 5}, {0, 100}) == ByteRange{20, 5});
}
