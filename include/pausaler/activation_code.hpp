#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace pausaler
{

    inline constexpr size_t kActivationNonceBytes = 16;

    /**
     * Unsigned request emitted by a user's installation and handed to the
     * issuer out of band. It is not a trust boundary; only the license
     * produced from it is signed.
     */
    struct ActivationCodePayload
    {
        std::string pib_hash; // SHA-256 hex of the trimmed tax identifier
        int64_t issued_at{0}; // Unix seconds
        std::string nonce;    // base64url of 16 random bytes
        std::string app_id;   // Canonical product identifier

        nlohmann::ordered_json to_json() const;
    };

    /**
     * Build an activation code for the given identifier hash with a fresh
     * random nonce. Output is base64url (no padding) of the JSON payload.
     */
    Result<std::string> generate_activation_code(
        const std::string &pib_hash,
        const std::string &app_id,
        int64_t issued_at);

    /**
     * Decode a pasted activation code and check that every field is
     * present and non-empty. The app id is not checked here.
     */
    Result<ActivationCodePayload> decode_activation_code(const std::string &code);

} // namespace pausaler
