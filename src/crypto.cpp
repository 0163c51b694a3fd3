#include "pausaler/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace pausaler::crypto
{

    // sodium_init must run before the first key derivation
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // Ed25519 signing key
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const Ed25519Seed &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(LicenseError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed_hex(const std::string &seed_hex)
    {
        auto decoded = Hex::decode(trim(seed_hex));
        if (!decoded)
        {
            return std::unexpected(decoded.error());
        }

        if (decoded->size() != crypto_sign_SEEDBYTES)
        {
            return std::unexpected(LicenseError::crypto("Signing seed must be 32 bytes"));
        }

        Ed25519Seed seed;
        std::copy_n(decoded->begin(), seed.size(), seed.begin());
        auto keypair = from_seed(seed);
        sodium_memzero(seed.data(), seed.size());
        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(), secret_key.data());
        return signature;
    }

    bool Ed25519KeyPair::verify(const Bytes &message, const Ed25519Signature &signature, const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(signature.data(), message.data(), message.size(), public_key.data()) == 0;
    }

    // ============================================================================
    // SHA-256
    // ============================================================================

    Sha256Digest sha256(std::string_view data)
    {
        Sha256Digest digest;
        crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size());
        return digest;
    }

    std::string sha256_hex(std::string_view data)
    {
        auto digest = sha256(data);
        return Hex::encode(Bytes(digest.begin(), digest.end()));
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const Bytes &data)
    {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.resize(data.size() * 2);
        return hex;
    }

    Result<Bytes> Hex::decode(const std::string &hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(LicenseError::encoding("Invalid hex length"));
        }

        Bytes decoded(hex.size() / 2);
        size_t decoded_len;
        const char *end = nullptr;

        if (sodium_hex2bin(
                decoded.data(),
                decoded.size(),
                hex.c_str(),
                hex.size(),
                nullptr,
                &decoded_len,
                &end) != 0 ||
            end != hex.c_str() + hex.size())
        {
            return std::unexpected(LicenseError::encoding("Invalid hex character"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    namespace
    {
        std::string encode_variant(const Bytes &data, int variant)
        {
            size_t b64_len = sodium_base64_encoded_len(data.size(), variant);
            std::string encoded(b64_len, '\0');

            sodium_bin2base64(
                encoded.data(),
                b64_len,
                data.data(),
                data.size(),
                variant);

            // Remove null terminator
            encoded.resize(std::strlen(encoded.c_str()));
            return encoded;
        }

        bool decode_variant(const std::string &encoded, int variant, Bytes &out)
        {
            out.resize(encoded.size() + 1); // Worst case size
            size_t decoded_len = 0;
            const char *end = nullptr;

            if (sodium_base642bin(
                    out.data(),
                    out.size(),
                    encoded.c_str(),
                    encoded.size(),
                    nullptr, // ignore characters
                    &decoded_len,
                    &end,
                    variant) != 0)
            {
                return false;
            }

            // Trailing garbage after a complete encoding is not accepted
            if (end != encoded.c_str() + encoded.size())
            {
                return false;
            }

            out.resize(decoded_len);
            return true;
        }
    } // namespace

    std::string Base64::encode(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_ORIGINAL);
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded;
        if (!decode_variant(encoded, sodium_base64_VARIANT_ORIGINAL, decoded))
        {
            return std::unexpected(LicenseError::encoding("Invalid base64 encoding"));
        }
        return decoded;
    }

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    }

    Result<Bytes> Base64::decode_url_safe(const std::string &encoded)
    {
        Bytes decoded;
        if (!decode_variant(encoded, sodium_base64_VARIANT_URLSAFE_NO_PADDING, decoded))
        {
            return std::unexpected(LicenseError::encoding("Invalid base64url encoding"));
        }
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    // ============================================================================
    // Identifier digest
    // ============================================================================

    std::string trim(const std::string &s)
    {
        auto is_space = [](unsigned char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        };
        auto first = std::find_if_not(s.begin(), s.end(), is_space);
        auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
        if (first >= last)
            return {};
        return std::string(first, last);
    }

    std::string hash_identifier(const std::string &identifier)
    {
        return sha256_hex(trim(identifier));
    }

} // namespace pausaler::crypto
