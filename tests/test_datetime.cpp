#include <catch2/catch_test_macros.hpp>
#include "core/datetime.hpp"

using namespace orabridge;

TEST_CASE("Datetime: normalize_date accepts valid calendar dates", "[datetime]") {
    auto leap = datetime::normalize_date("2024-02-29");
    REQUIRE(leap.is_ok());
    CHECK(leap.value() == "2024-02-29");
}

TEST_CASE("Datetime: normalize_date rejects impossible or trailing input", "[datetime]") {
    for (const char* bad : {"2023-02-29", "2024-13-01", "2024-01-15T00:00:00", "yesterday"}) {
        auto r = datetime::normalize_date(bad);
        INFO(bad);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::CONVERSION_ERROR);
        CHECK(r.error_message().find("does not match format") != std::string::npos);
    }
}

TEST_CASE("Datetime: normalize_datetime converts T separator to space", "[datetime]") {
    auto r = datetime::normalize_datetime("2024-01-15T10:30:00");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "2024-01-15 10:30:00");
}

TEST_CASE("Datetime: normalize_datetime requires the T separator", "[datetime]") {
    CHECK(datetime::normalize_datetime("2024-01-15 10:30:00").is_error());
    CHECK(datetime::normalize_datetime("2024-01-15").is_error());
    CHECK(datetime::normalize_datetime("2024-02-30T10:30:00").is_error());
}

TEST_CASE("Datetime: native rendering with date only gets midnight", "[datetime]") {
    auto r = datetime::parse_native_datetime("2024-01-15");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "2024-01-15T00:00:00");
}

TEST_CASE("Datetime: native rendering accepts space or T separator", "[datetime]") {
    auto space = datetime::parse_native_datetime("2024-01-15 10:30:45");
    REQUIRE(space.is_ok());
    CHECK(space.value() == "2024-01-15T10:30:45");

    auto t = datetime::parse_native_datetime("2024-01-15T10:30:45");
    REQUIRE(t.is_ok());
    CHECK(t.value() == "2024-01-15T10:30:45");
}

TEST_CASE("Datetime: fractional seconds keep significant digits only", "[datetime]") {
    auto frac = datetime::parse_native_datetime("2024-01-15 10:30:45.120000");
    REQUIRE(frac.is_ok());
    CHECK(frac.value() == "2024-01-15T10:30:45.12");

    auto zero = datetime::parse_native_datetime("2024-01-15 10:30:45.000");
    REQUIRE(zero.is_ok());
    CHECK(zero.value() == "2024-01-15T10:30:45");
}

TEST_CASE("Datetime: malformed native rendering is a conversion error", "[datetime]") {
    for (const char* bad : {"garbage", "2024-01-15 10:30", "2024-01-15 10:30:45.", "2024-02-30 00:00:00"}) {
        auto r = datetime::parse_native_datetime(bad);
        INFO(bad);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::CONVERSION_ERROR);
    }
}

TEST_CASE("Datetime: timestamp rendering without a zone", "[datetime][timestamp]") {
    datetime::TimestampFields ts;
    ts.year = 2024; ts.month = 3; ts.day = 9;
    ts.hour = 7; ts.minute = 5; ts.second = 1;
    CHECK(datetime::format_timestamp(ts) == "2024-03-09 07:05:01");

    ts.fsecond = 120000000;
    CHECK(datetime::format_timestamp(ts) == "2024-03-09 07:05:01.120000000");
}

TEST_CASE("Datetime: zoned timestamps keep their offset", "[datetime][timestamp]") {
    datetime::TimestampFields ts;
    ts.year = 2024; ts.month = 3; ts.day = 9;
    ts.hour = 7; ts.minute = 5; ts.second = 1;

    ts.tz_offset_minutes = 5 * 60 + 30;
    CHECK(datetime::format_timestamp(ts) == "2024-03-09 07:05:01 +05:30");

    ts.tz_offset_minutes = -(3 * 60 + 30);
    CHECK(datetime::format_timestamp(ts) == "2024-03-09 07:05:01 -03:30");

    ts.tz_offset_minutes = 0;
    CHECK(datetime::format_timestamp(ts) == "2024-03-09 07:05:01 +00:00");
}
