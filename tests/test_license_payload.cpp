#include <catch2/catch_test_macros.hpp>
#include "pausaler/license_payload.hpp"
#include <string>

using namespace pausaler;

namespace
{
    const std::string kPibHash = "15e2b0d3c33891ebb0f1ef609ec419420c20e320ce94c65fbc8c3312448eb225";

    crypto::Bytes to_bytes(const std::string &s)
    {
        return crypto::Bytes(s.begin(), s.end());
    }
}

TEST_CASE("Yearly payload serializes in signing order", "[payload]")
{
    LicensePayload payload{LicenseType::Yearly, "2025-01-01T00:00:00Z", "2026-01-01T00:00:00Z", kPibHash};

    auto bytes = payload.serialize();
    REQUIRE(bytes.has_value());
    REQUIRE(std::string(bytes->begin(), bytes->end()) ==
            "{\"license_type\":\"YEARLY\",\"valid_from\":\"2025-01-01T00:00:00Z\","
            "\"valid_until\":\"2026-01-01T00:00:00Z\",\"pib_hash\":\"" + kPibHash + "\"}");
}

TEST_CASE("Lifetime payload omits valid_until", "[payload]")
{
    LicensePayload payload{LicenseType::Lifetime, "2025-01-01T00:00:00Z", std::nullopt, kPibHash};

    auto bytes = payload.serialize();
    REQUIRE(bytes.has_value());
    std::string json(bytes->begin(), bytes->end());
    REQUIRE(json == "{\"license_type\":\"LIFETIME\",\"valid_from\":\"2025-01-01T00:00:00Z\",\"pib_hash\":\"" + kPibHash + "\"}");
    REQUIRE(json.find("null") == std::string::npos);
}

TEST_CASE("Payload parse reads all fields", "[payload]")
{
    auto parsed = LicensePayload::parse(to_bytes(
        "{\"pib_hash\":\"abc\",\"valid_until\":\"2026-01-01T00:00:00Z\","
        "\"license_type\":\"YEARLY\",\"valid_from\":\"2025-01-01T00:00:00Z\"}"));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->license_type == LicenseType::Yearly);
    REQUIRE(parsed->valid_from == "2025-01-01T00:00:00Z");
    REQUIRE(parsed->valid_until == "2026-01-01T00:00:00Z");
    REQUIRE(parsed->pib_hash == "abc");
}

TEST_CASE("Payload parse treats null valid_until as absent", "[payload]")
{
    auto parsed = LicensePayload::parse(to_bytes(
        "{\"license_type\":\"LIFETIME\",\"valid_from\":\"2025-01-01T00:00:00Z\",\"valid_until\":null,\"pib_hash\":\"abc\"}"));
    REQUIRE(parsed.has_value());
    REQUIRE_FALSE(parsed->valid_until.has_value());
}

TEST_CASE("Payload parse rejects bad input", "[payload]")
{
    const std::string bad_inputs[] = {
        "not json",
        "[1,2,3]",
        "{\"license_type\":\"MONTHLY\",\"valid_from\":\"2025-01-01T00:00:00Z\",\"pib_hash\":\"abc\"}",
        "{\"license_type\":\"yearly\",\"valid_from\":\"2025-01-01T00:00:00Z\",\"pib_hash\":\"abc\"}",
        "{\"license_type\":\"LIFETIME\",\"pib_hash\":\"abc\"}",
        "{\"license_type\":\"LIFETIME\",\"valid_from\":\"2025-01-01T00:00:00Z\"}",
        "{\"license_type\":\"LIFETIME\",\"valid_from\":17356896,\"pib_hash\":\"abc\"}",
        "{\"license_type\":\"YEARLY\",\"valid_from\":\"2025-01-01T00:00:00Z\",\"valid_until\":5,\"pib_hash\":\"abc\"}",
    };

    for (const auto &input : bad_inputs)
    {
        auto parsed = LicensePayload::parse(to_bytes(input));
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::InvalidPayload);
    }
}

TEST_CASE("License type wire names", "[payload]")
{
    REQUIRE(license_type_to_string(LicenseType::Yearly) == "YEARLY");
    REQUIRE(license_type_to_string(LicenseType::Lifetime) == "LIFETIME");
    REQUIRE(license_type_from_string("YEARLY") == LicenseType::Yearly);
    REQUIRE(license_type_from_string("LIFETIME") == LicenseType::Lifetime);
    REQUIRE_FALSE(license_type_from_string("Lifetime").has_value());
}
