#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "license_payload.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pausaler
{

    /**
     * Expected lifecycle outcomes of a verification. These are data, not
     * errors: the host shows a remediation message for each.
     */
    enum class VerdictReason
    {
        InvalidFormat,
        PibMismatch,
        NotYetValid,
        Expired
    };

    inline std::string verdict_reason_to_string(VerdictReason reason)
    {
        switch (reason)
        {
        case VerdictReason::InvalidFormat:
            return "invalid_format";
        case VerdictReason::PibMismatch:
            return "pib_mismatch";
        case VerdictReason::NotYetValid:
            return "not_yet_valid";
        case VerdictReason::Expired:
            return "expired";
        }
        return "unknown";
    }

    struct VerificationVerdict
    {
        // On PibMismatch these come from a payload whose signature was
        // never checked; display only, never feature gating.
        std::optional<std::string> license_type;
        std::optional<std::string> valid_until;
        bool is_valid{false};
        std::optional<VerdictReason> reason;

        nlohmann::json to_json() const;
    };

    /**
     * Checks license strings against the embedded public key. Holds only
     * immutable state, so one instance may be shared across threads.
     */
    class LicenseVerifier
    {
    public:
        explicit LicenseVerifier(const crypto::Ed25519PublicKey &public_key);

        /**
         * Build from an SPKI PEM block (the embedded key)
         */
        static Result<LicenseVerifier> from_pem(const std::string &public_key_pem);

        /**
         * Verify a license string for an expected identifier hash at time now.
         *
         * Returns a verdict for lifecycle outcomes (invalid_format,
         * pib_mismatch, not_yet_valid, expired, valid). Returns an error for
         * input that is not a recognizable license: bad base64url, bad
         * payload JSON, failed signature, bad timestamps or a Yearly payload
         * without valid_until.
         *
         * The identifier comparison runs before signature verification.
         */
        Result<VerificationVerdict> verify(const std::string &license,
                                           const std::string &expected_pib_hash,
                                           TimePoint now) const;

        const crypto::Ed25519PublicKey &public_key() const { return public_key_; }

    private:
        Result<void> check_signature(const crypto::Bytes &payload_bytes,
                                     const crypto::Bytes &signature_bytes) const;

        crypto::Ed25519PublicKey public_key_;
    };

    /**
     * Single-call entry point: hashes the plaintext identifier, decodes the
     * PEM and verifies.
     */
    Result<VerificationVerdict> verify_license(const std::string &license,
                                               const std::string &identifier,
                                               const std::string &public_key_pem,
                                               TimePoint now);

} // namespace pausaler
