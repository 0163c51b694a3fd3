#include <catch2/catch_test_macros.hpp>
#include "pausaler/timestamp.hpp"
#include <string>

using namespace pausaler;
using namespace std::chrono;

TEST_CASE("Format uses UTC with second precision", "[timestamp]")
{
    REQUIRE(timestamp::format_rfc3339(TimePoint{}) == "1970-01-01T00:00:00Z");
    REQUIRE(timestamp::format_rfc3339(timestamp::from_unix_seconds(1735689600)) == "2025-01-01T00:00:00Z");

    TimePoint with_millis = timestamp::from_unix_seconds(1735734896) + milliseconds{789};
    REQUIRE(timestamp::format_rfc3339(with_millis) == "2025-01-01T12:34:56Z");
}

TEST_CASE("Parse Z and numeric offsets", "[timestamp]")
{
    auto utc = timestamp::parse_rfc3339("2025-01-01T00:00:00Z");
    REQUIRE(utc.has_value());
    REQUIRE(timestamp::to_unix_seconds(*utc) == 1735689600);

    auto plus = timestamp::parse_rfc3339("2025-01-01T02:00:00+02:00");
    REQUIRE(plus.has_value());
    REQUIRE(*plus == *utc);

    auto minus = timestamp::parse_rfc3339("2024-12-31T19:30:00-04:30");
    REQUIRE(minus.has_value());
    REQUIRE(*minus == *utc);

    auto lower = timestamp::parse_rfc3339("2025-01-01t00:00:00z");
    REQUIRE(lower.has_value());
    REQUIRE(*lower == *utc);
}

TEST_CASE("Parse fractional seconds", "[timestamp]")
{
    auto parsed = timestamp::parse_rfc3339("2025-01-01T00:00:00.5Z");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed - timestamp::from_unix_seconds(1735689600) == milliseconds{500});
    REQUIRE(timestamp::format_rfc3339(*parsed) == "2025-01-01T00:00:00Z");

    REQUIRE_FALSE(timestamp::parse_rfc3339("2025-01-01T00:00:00.Z").has_value());
}

TEST_CASE("Parse leap day", "[timestamp]")
{
    REQUIRE(timestamp::parse_rfc3339("2024-02-29T12:00:00Z").has_value());
    REQUIRE_FALSE(timestamp::parse_rfc3339("2025-02-29T12:00:00Z").has_value());
}

TEST_CASE("Parse rejects malformed date-times", "[timestamp]")
{
    const char *bad_inputs[] = {
        "",
        "2025-13-01T00:00:00Z",
        "2025-02-30T00:00:00Z",
        "2025-01-01T24:00:00Z",
        "2025-01-01T00:60:00Z",
        "2025-01-01 00:00:00Z",
        "2025-01-01T00:00:00",
        "2025-01-01T00:00:00+0200",
        "2025-01-01T00:00:00Zjunk",
        "2025-1-01T00:00:00Z",
        "not a date",
    };

    for (const char *input : bad_inputs)
    {
        auto parsed = timestamp::parse_rfc3339(input);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::InvalidTimestamp);
    }
}

TEST_CASE("Unix seconds conversion", "[timestamp]")
{
    TimePoint tp = timestamp::from_unix_seconds(1735689600) + milliseconds{999};
    REQUIRE(timestamp::to_unix_seconds(tp) == 1735689600);
    REQUIRE(timestamp::floor_seconds(tp) == timestamp::from_unix_seconds(1735689600));
}
