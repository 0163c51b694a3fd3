#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "audit.hpp"
#include "activation_code.hpp"
#include "license_payload.hpp"
#include <chrono>
#include <string>

namespace pausaler
{

    /** Fixed-length licensing year; no calendar adjustment */
    inline constexpr std::chrono::days kYearlyValidity{365};

    /**
     * Offline license minting. Holds the private signing key; the only
     * component able to produce licenses the verifier accepts.
     */
    class LicenseIssuer
    {
    public:
        LicenseIssuer(crypto::Ed25519KeyPair signing_key,
                      std::string expected_app_id,
                      AuditLogger audit = AuditLogger{});

        /**
         * Build an issuer from a 32-byte seed given as hex
         */
        static Result<LicenseIssuer> from_seed_hex(const std::string &seed_hex,
                                                   std::string expected_app_id,
                                                   AuditLogger audit = AuditLogger{});

        /**
         * Validate an activation code and emit a signed license string.
         * Every failure is final for this attempt: malformed code, a
         * missing field or an app id that is not ours.
         */
        Result<std::string> issue(const std::string &activation_code,
                                  LicenseType type,
                                  TimePoint now) const;

        /**
         * Claims for an identifier hash. valid_from is now truncated to
         * whole seconds; Yearly licenses end kYearlyValidity later.
         */
        static LicensePayload build_payload(const std::string &pib_hash,
                                            LicenseType type,
                                            TimePoint now);

        /**
         * Serialize once and sign those exact bytes:
         * base64url(payload) '.' base64url(signature)
         */
        Result<std::string> sign(const LicensePayload &payload) const;

        const crypto::Ed25519PublicKey &public_key() const { return signing_key_.public_key; }

        /** SPKI PEM of the verifying key, for embedding in product builds */
        std::string public_key_pem() const;

        const std::string &expected_app_id() const { return expected_app_id_; }

    private:
        Result<std::string> issue_checked(const ActivationCodePayload &activation,
                                          LicenseType type,
                                          TimePoint now,
                                          AuditEvent &event) const;

        crypto::Ed25519KeyPair signing_key_;
        std::string expected_app_id_;
        AuditLogger audit_;
    };

} // namespace pausaler
