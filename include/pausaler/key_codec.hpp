#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <array>
#include <string>

namespace pausaler::key_codec
{

    /**
     * DER header of an Ed25519 SubjectPublicKeyInfo:
     * SEQUENCE { SEQUENCE { OID 1.3.101.112 }, BIT STRING (33 bytes, 0 unused bits) }
     * The raw 32-byte key follows directly.
     */
    inline constexpr std::array<uint8_t, 12> kEd25519SpkiPrefix = {
        0x30, 0x2a, 0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70, 0x03, 0x21, 0x00};

    inline constexpr size_t kSpkiLength = 44;
    inline constexpr size_t kPemLineWidth = 64;

    /**
     * Wrap a raw Ed25519 public key into an SPKI PEM block.
     * Lines are kPemLineWidth wide and each ends with '\n'.
     */
    std::string encode_public_key_pem(const crypto::Ed25519PublicKey &public_key);

    /**
     * Extract the raw key from an SPKI PEM block. Only Ed25519 is
     * supported; anything else fails with ErrorCode::UnsupportedKeyFormat.
     */
    Result<crypto::Ed25519PublicKey> decode_public_key_pem(const std::string &pem);

} // namespace pausaler::key_codec
