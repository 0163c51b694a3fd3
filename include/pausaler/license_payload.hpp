#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pausaler
{

    /** Joins the encoded payload and the encoded signature of a license string */
    inline constexpr char kLicenseSeparator = '.';

    enum class LicenseType
    {
        Yearly,
        Lifetime
    };

    /**
     * Wire name of a license type ("YEARLY" / "LIFETIME")
     */
    inline std::string license_type_to_string(LicenseType type)
    {
        switch (type)
        {
        case LicenseType::Yearly:
            return "YEARLY";
        case LicenseType::Lifetime:
            return "LIFETIME";
        }
        return "UNKNOWN";
    }

    inline std::optional<LicenseType> license_type_from_string(const std::string &s)
    {
        if (s == "YEARLY")
            return LicenseType::Yearly;
        if (s == "LIFETIME")
            return LicenseType::Lifetime;
        return std::nullopt;
    }

    /**
     * Signed license claims. Serialized once at issue time; the verifier
     * checks the signature against the exact received bytes and never
     * re-serializes.
     *
     * valid_until is present iff license_type is Yearly.
     */
    struct LicensePayload
    {
        LicenseType license_type{LicenseType::Lifetime};
        std::string valid_from;                // RFC3339, second precision
        std::optional<std::string> valid_until; // RFC3339, omitted for Lifetime
        std::string pib_hash;

        /**
         * Field order: license_type, valid_from, valid_until, pib_hash.
         * An absent valid_until is omitted, never written as null.
         */
        nlohmann::ordered_json to_json() const;

        /** Compact JSON bytes, the exact bytes that get signed */
        Result<crypto::Bytes> serialize() const;

        /**
         * Parse received payload bytes. Fails with InvalidPayload on bad
         * JSON, wrong field types or an unknown license type.
         */
        static Result<LicensePayload> parse(const crypto::Bytes &bytes);
    };

} // namespace pausaler
