#include <catch2/catch.hpp>
#include "utils/time_utils.hpp"

using namespace wordbase;

TEST_CASE("birthday formats are tried in order", "[time_utils]") {
    CHECK(normalizeDate("03-01-2002") == std::string("2002-01-03"));
    CHECK(normalizeDate("2002-01-03") == std::string("2002-01-03"));
    CHECK(normalizeDate("03/01/2002") == std::string("2002-01-03"));
    CHECK(normalizeDate("01/13/2002") == std::string("2002-01-13"));
    CHECK(normalizeDate("03.01.2002") == std::string("2002-01-03"));
    CHECK(normalizeDate("2002.01.03") == std::string("2002-01-03"));
}

TEST_CASE("impossible or foreign dates are rejected", "[time_utils]") {
    CHECK_FALSE(normalizeDate("31-02-2001").has_value());
    CHECK_FALSE(normalizeDate("2001/02/03").has_value());
    CHECK_FALSE(normalizeDate("yesterday").has_value());
    CHECK_FALSE(normalizeDate("03-01-2002 extra").has_value());
    CHECK_FALSE(normalizeDate("").has_value());
}

TEST_CASE("ISO timestamps with and without offsets", "[time_utils]") {
    const TimePoint expected = fromUnixSeconds(1704067200);  // 2024-01-01T00:00:00Z

    CHECK(parseIsoTimestamp("2024-01-01T00:00:00Z") == expected);
    CHECK(parseIsoTimestamp("2024-01-01T00:00:00") == expected);
    CHECK(parseIsoTimestamp("2024-01-01 00:00:00") == expected);
    CHECK(parseIsoTimestamp("2024-01-01T00:00:00.123456") == expected);
    CHECK(parseIsoTimestamp("2024-01-01") == expected);
    CHECK(parseIsoTimestamp("2024-01-01T03:00:00+03:00") == expected);
    CHECK(parseIsoTimestamp("2023-12-31T19:00:00-0500") == expected);
}

TEST_CASE("broken ISO timestamps are rejected", "[time_utils]") {
    CHECK_FALSE(parseIsoTimestamp("2024-13-01T00:00:00").has_value());
    CHECK_FALSE(parseIsoTimestamp("2024-02-30").has_value());
    CHECK_FALSE(parseIsoTimestamp("2024-01-01T25:00").has_value());
    CHECK_FALSE(parseIsoTimestamp("01/01/2024").has_value());
    CHECK_FALSE(parseIsoTimestamp("2024-01-01T00:00:00Zjunk").has_value());
}

TEST_CASE("timestamps format in UTC", "[time_utils]") {
    const TimePoint tp = fromUnixSeconds(1704067200 + 3661);
    CHECK(formatTimestamp(tp) == "2024-01-01 01:01:01.000000+00");
    CHECK(formatIsoTimestamp(tp) == "2024-01-01T01:01:01Z");
    CHECK(parseIsoTimestamp(formatIsoTimestamp(tp)) == tp);
    CHECK(toUnixSeconds(tp) == 1704067200 + 3661);
}

TEST_CASE("timestamp parameters keep microseconds", "[time_utils]") {
    const TimePoint tp = fromUnixSeconds(1700086400) + std::chrono::microseconds(400123);
    CHECK(formatTimestamp(tp) == "2023-11-15 22:13:20.400123+00");
    CHECK(formatTimestamp(tp + std::chrono::nanoseconds(999)) == "2023-11-15 22:13:20.400123+00");

    const TimePoint before_epoch = fromUnixSeconds(-1) + std::chrono::milliseconds(250);
    CHECK(formatTimestamp(before_epoch) == "1969-12-31 23:59:59.250000+00");
}
