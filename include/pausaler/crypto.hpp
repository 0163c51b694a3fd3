#pragma once

#include "types.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace pausaler::crypto
{

    using Bytes = std::vector<uint8_t>;
    using Ed25519Seed = std::array<uint8_t, 32>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>; // libsodium layout: seed || public key
    using Ed25519Signature = std::array<uint8_t, 64>;
    using Sha256Digest = std::array<uint8_t, 32>;

    /**
     * License signing key. Only the issuer ever holds one; the verifier
     * works from the public half alone.
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        static Result<Ed25519KeyPair> from_seed(const Ed25519Seed &seed);

        /**
         * Seed given as 64 hex characters, as stored in issuer config.
         * Surrounding whitespace is ignored.
         */
        static Result<Ed25519KeyPair> from_seed_hex(const std::string &seed_hex);

        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Strict verification: rejects non-canonical signatures, small
         * order points and non-canonical key encodings.
         */
        static bool verify(const Bytes &message, const Ed25519Signature &signature, const Ed25519PublicKey &public_key);
    };

    Sha256Digest sha256(std::string_view data);

    /** SHA-256 as 64 lowercase hex characters */
    std::string sha256_hex(std::string_view data);

    class Hex
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &hex);
    };

    /**
     * Two alphabets are in use: standard padded base64 inside PEM blocks,
     * and unpadded base64url for activation codes and license segments.
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);

        static std::string encode_url_safe(const Bytes &data);

        /**
         * Padding characters and characters outside the URL-safe alphabet
         * are rejected.
         */
        static Result<Bytes> decode_url_safe(const std::string &encoded);
    };

    class SecureRandom
    {
    public:
        static Bytes generate_bytes(size_t n);
    };

    /**
     * Hash a plaintext tax identifier (PIB) into its 64-char lowercase hex
     * correlation key. Surrounding whitespace is trimmed first; no salt.
     */
    std::string hash_identifier(const std::string &identifier);

    /** Trim ASCII whitespace from both ends */
    std::string trim(const std::string &s);

} // namespace pausaler::crypto
