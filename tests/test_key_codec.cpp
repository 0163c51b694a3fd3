#include <catch2/catch_test_macros.hpp>
#include "pausaler/key_codec.hpp"
#include "pausaler/config.hpp"
#include "pausaler/embedded_public_key.hpp"

using namespace pausaler;
using namespace pausaler::key_codec;

namespace
{
    const std::string kRfcPublicKeyPem =
        "-----BEGIN PUBLIC KEY-----\n"
        "MCowBQYDK2VwAyEA11qYAYKxCrfVS/7TyWQHOg7hcvPapiMlrwIaaPcHURo=\n"
        "-----END PUBLIC KEY-----\n";

    crypto::Ed25519PublicKey rfc_public_key()
    {
        auto kp = crypto::Ed25519KeyPair::from_seed_hex(
            "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
        return kp.value().public_key;
    }

    std::string wrap_pem(const crypto::Bytes &der)
    {
        return "-----BEGIN PUBLIC KEY-----\n" + crypto::Base64::encode(der) + "\n-----END PUBLIC KEY-----\n";
    }
}

TEST_CASE("Public key encodes to standard SPKI PEM", "[key_codec]")
{
    REQUIRE(encode_public_key_pem(rfc_public_key()) == kRfcPublicKeyPem);
}

TEST_CASE("Public key PEM round trip", "[key_codec]")
{
    auto kp = crypto::Ed25519KeyPair::from_seed_hex(std::string(64, '7')).value();

    auto decoded = decode_public_key_pem(encode_public_key_pem(kp.public_key));
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == kp.public_key);
}

TEST_CASE("PEM decoding tolerates CRLF and indentation", "[key_codec]")
{
    std::string pem =
        "\r\n  -----BEGIN PUBLIC KEY-----\r\n"
        "  MCowBQYDK2VwAyEA11qYAYKxCrfVS/7TyWQH\r\n"
        "  Og7hcvPapiMlrwIaaPcHURo=\r\n"
        "-----END PUBLIC KEY-----";

    auto decoded = decode_public_key_pem(pem);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == rfc_public_key());
}

TEST_CASE("PEM with wrong length is unsupported", "[key_codec]")
{
    crypto::Bytes der(kEd25519SpkiPrefix.begin(), kEd25519SpkiPrefix.end());
    der.insert(der.end(), 31, 0x42);

    auto decoded = decode_public_key_pem(wrap_pem(der));
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::UnsupportedKeyFormat);

    der.insert(der.end(), 2, 0x42);
    decoded = decode_public_key_pem(wrap_pem(der));
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::UnsupportedKeyFormat);
}

TEST_CASE("PEM with another algorithm OID is unsupported", "[key_codec]")
{
    // X25519 (1.3.101.110) has the same shape as Ed25519
    crypto::Bytes der(kEd25519SpkiPrefix.begin(), kEd25519SpkiPrefix.end());
    der[8] = 0x6e;
    der.insert(der.end(), 32, 0x42);

    auto decoded = decode_public_key_pem(wrap_pem(der));
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::UnsupportedKeyFormat);
}

TEST_CASE("PEM with broken base64 is unsupported", "[key_codec]")
{
    auto decoded = decode_public_key_pem("-----BEGIN PUBLIC KEY-----\n!!!!\n-----END PUBLIC KEY-----\n");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::UnsupportedKeyFormat);

    REQUIRE_FALSE(decode_public_key_pem("").has_value());
}

TEST_CASE("Embedded key matches the development signing seed", "[key_codec]")
{
    LicensingConfig cfg{};
    auto kp = crypto::Ed25519KeyPair::from_seed_hex(cfg.effective_signing_seed_hex());
    REQUIRE(kp.has_value());

    auto embedded = decode_public_key_pem(kEmbeddedPublicKeyPem);
    REQUIRE(embedded.has_value());
    REQUIRE(*embedded == kp->public_key);
    REQUIRE(encode_public_key_pem(kp->public_key) == kEmbeddedPublicKeyPem);
}
