#include "pausaler/license_verifier.hpp"
#include "pausaler/key_codec.hpp"
#include "pausaler/timestamp.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace pausaler
{
    namespace
    {
        VerificationVerdict invalid(VerdictReason reason,
                                    std::optional<std::string> license_type = std::nullopt,
                                    std::optional<std::string> valid_until = std::nullopt)
        {
            spdlog::debug("License rejected: {}", verdict_reason_to_string(reason));
            VerificationVerdict verdict;
            verdict.license_type = std::move(license_type);
            verdict.valid_until = std::move(valid_until);
            verdict.is_valid = false;
            verdict.reason = reason;
            return verdict;
        }

        VerificationVerdict valid(LicenseType type, std::optional<std::string> valid_until)
        {
            spdlog::debug("License valid: {}", license_type_to_string(type));
            VerificationVerdict verdict;
            verdict.license_type = license_type_to_string(type);
            verdict.valid_until = std::move(valid_until);
            verdict.is_valid = true;
            return verdict;
        }
    } // namespace

    nlohmann::json VerificationVerdict::to_json() const
    {
        nlohmann::json j;
        j["license_type"] = license_type ? nlohmann::json(*license_type) : nlohmann::json(nullptr);
        j["valid_until"] = valid_until ? nlohmann::json(*valid_until) : nlohmann::json(nullptr);
        j["is_valid"] = is_valid;
        j["reason"] = reason ? nlohmann::json(verdict_reason_to_string(*reason)) : nlohmann::json(nullptr);
        return j;
    }

    LicenseVerifier::LicenseVerifier(const crypto::Ed25519PublicKey &public_key)
        : public_key_(public_key)
    {
    }

    Result<LicenseVerifier> LicenseVerifier::from_pem(const std::string &public_key_pem)
    {
        auto key = key_codec::decode_public_key_pem(public_key_pem);
        if (!key)
        {
            return std::unexpected(key.error());
        }
        return LicenseVerifier(*key);
    }

    Result<void> LicenseVerifier::check_signature(const crypto::Bytes &payload_bytes,
                                                  const crypto::Bytes &signature_bytes) const
    {
        if (signature_bytes.size() != std::tuple_size_v<crypto::Ed25519Signature>)
        {
            return std::unexpected(LicenseError::signature("invalid signature length"));
        }

        crypto::Ed25519Signature signature;
        std::copy(signature_bytes.begin(), signature_bytes.end(), signature.begin());

        if (!crypto::Ed25519KeyPair::verify(payload_bytes, signature, public_key_))
        {
            return std::unexpected(LicenseError::signature("signature verification failed"));
        }
        return {};
    }

    Result<VerificationVerdict> LicenseVerifier::verify(const std::string &license,
                                                        const std::string &expected_pib_hash,
                                                        TimePoint now) const
    {
        // 1. Shape: exactly one separator
        auto separator = license.find(kLicenseSeparator);
        if (separator == std::string::npos ||
            license.find(kLicenseSeparator, separator + 1) != std::string::npos)
        {
            return invalid(VerdictReason::InvalidFormat);
        }

        // 2. Transport decoding
        auto payload_bytes = crypto::Base64::decode_url_safe(license.substr(0, separator));
        if (!payload_bytes)
        {
            return std::unexpected(payload_bytes.error());
        }
        auto signature_bytes = crypto::Base64::decode_url_safe(license.substr(separator + 1));
        if (!signature_bytes)
        {
            return std::unexpected(signature_bytes.error());
        }

        // 3. Claims
        auto payload = LicensePayload::parse(*payload_bytes);
        if (!payload)
        {
            return std::unexpected(payload.error());
        }

        // 4. Identifier binding, before the signature is checked
        if (payload->pib_hash != expected_pib_hash)
        {
            return invalid(VerdictReason::PibMismatch,
                           license_type_to_string(payload->license_type),
                           payload->valid_until);
        }

        // 5. Signature over the exact received bytes
        auto signature_ok = check_signature(*payload_bytes, *signature_bytes);
        if (!signature_ok)
        {
            spdlog::warn("License signature rejected: {}", signature_ok.error().what());
            return std::unexpected(signature_ok.error());
        }

        // 6. Start of validity
        auto valid_from = timestamp::parse_rfc3339(payload->valid_from);
        if (!valid_from)
        {
            return std::unexpected(valid_from.error());
        }
        if (now < *valid_from)
        {
            return invalid(VerdictReason::NotYetValid,
                           license_type_to_string(payload->license_type),
                           payload->valid_until);
        }

        // 7. End of validity
        switch (payload->license_type)
        {
        case LicenseType::Lifetime:
            return valid(LicenseType::Lifetime, std::nullopt);

        case LicenseType::Yearly:
        {
            if (!payload->valid_until)
            {
                return std::unexpected(LicenseError::payload("missing valid_until"));
            }
            auto valid_until = timestamp::parse_rfc3339(*payload->valid_until);
            if (!valid_until)
            {
                return std::unexpected(valid_until.error());
            }
            if (now > *valid_until)
            {
                return invalid(VerdictReason::Expired, license_type_to_string(LicenseType::Yearly), payload->valid_until);
            }
            return valid(LicenseType::Yearly, payload->valid_until);
        }
        }

        return std::unexpected(LicenseError::payload("unknown license_type"));
    }

    Result<VerificationVerdict> verify_license(const std::string &license,
                                               const std::string &identifier,
                                               const std::string &public_key_pem,
                                               TimePoint now)
    {
        auto verifier = LicenseVerifier::from_pem(public_key_pem);
        if (!verifier)
        {
            return std::unexpected(verifier.error());
        }
        return verifier->verify(license, crypto::hash_identifier(identifier), now);
    }

} // namespace pausaler
