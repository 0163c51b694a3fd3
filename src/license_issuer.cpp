#include "pausaler/license_issuer.hpp"
#include "pausaler/key_codec.hpp"
#include "pausaler/timestamp.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace pausaler
{

    LicenseIssuer::LicenseIssuer(crypto::Ed25519KeyPair signing_key,
                                 std::string expected_app_id,
                                 AuditLogger audit)
        : signing_key_(std::move(signing_key)),
          expected_app_id_(std::move(expected_app_id)),
          audit_(audit)
    {
    }

    Result<LicenseIssuer> LicenseIssuer::from_seed_hex(const std::string &seed_hex,
                                                       std::string expected_app_id,
                                                       AuditLogger audit)
    {
        auto keypair = crypto::Ed25519KeyPair::from_seed_hex(seed_hex);
        if (!keypair)
        {
            return std::unexpected(keypair.error());
        }
        return LicenseIssuer(*keypair, std::move(expected_app_id), audit);
    }

    LicensePayload LicenseIssuer::build_payload(const std::string &pib_hash,
                                                LicenseType type,
                                                TimePoint now)
    {
        TimePoint valid_from = timestamp::floor_seconds(now);

        LicensePayload payload;
        payload.license_type = type;
        payload.valid_from = timestamp::format_rfc3339(valid_from);
        if (type == LicenseType::Yearly)
        {
            payload.valid_until = timestamp::format_rfc3339(valid_from + kYearlyValidity);
        }
        payload.pib_hash = pib_hash;
        return payload;
    }

    Result<std::string> LicenseIssuer::sign(const LicensePayload &payload) const
    {
        auto payload_bytes = payload.serialize();
        if (!payload_bytes)
        {
            return std::unexpected(payload_bytes.error());
        }

        auto signature = signing_key_.sign(*payload_bytes);
        crypto::Bytes signature_bytes(signature.begin(), signature.end());

        return crypto::Base64::encode_url_safe(*payload_bytes) + kLicenseSeparator +
               crypto::Base64::encode_url_safe(signature_bytes);
    }

    Result<std::string> LicenseIssuer::issue(const std::string &activation_code,
                                             LicenseType type,
                                             TimePoint now) const
    {
        AuditEvent event;
        event.ts = audit_timestamp(now);
        event.action = "license.issue";
        event.license_type = license_type_to_string(type);

        auto activation = decode_activation_code(activation_code);
        if (!activation)
        {
            event.result = error_code_to_string(activation.error().code);
            event.details["error"] = activation.error().what();
            audit_.log(event);
            return std::unexpected(activation.error());
        }

        event.pib_hash = activation->pib_hash;
        auto license = issue_checked(*activation, type, now, event);
        if (!license)
        {
            event.result = error_code_to_string(license.error().code);
            event.details["error"] = license.error().what();
        }
        else
        {
            event.result = "ok";
        }
        audit_.log(event);
        return license;
    }

    Result<std::string> LicenseIssuer::issue_checked(const ActivationCodePayload &activation,
                                                     LicenseType type,
                                                     TimePoint now,
                                                     AuditEvent &event) const
    {
        if (activation.app_id != expected_app_id_)
        {
            return std::unexpected(LicenseError(
                ErrorCode::AppIdMismatch,
                "activation code app_id mismatch: expected " + expected_app_id_ + ", got " + activation.app_id));
        }

        LicensePayload payload = build_payload(activation.pib_hash, type, now);
        event.valid_until = payload.valid_until;
        event.details["valid_from"] = payload.valid_from;
        event.details["activation_issued_at"] = activation.issued_at;

        spdlog::debug("Signing {} license valid from {}", license_type_to_string(type), payload.valid_from);
        return sign(payload);
    }

    std::string LicenseIssuer::public_key_pem() const
    {
        return key_codec::encode_public_key_pem(signing_key_.public_key);
    }

} // namespace pausaler
