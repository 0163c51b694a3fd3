#include "pausaler/license_client.hpp"
#include "pausaler/activation_code.hpp"
#include "pausaler/crypto.hpp"
#include "pausaler/embedded_public_key.hpp"
#include "pausaler/timestamp.hpp"
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <utility>

namespace pausaler
{

    LicenseClient::LicenseClient(std::string app_id, LicenseVerifier verifier)
        : app_id_(std::move(app_id)), verifier_(std::move(verifier))
    {
    }

    Result<LicenseClient> LicenseClient::from_config(const LicensingConfig &cfg)
    {
        std::string pem = kEmbeddedPublicKeyPem;
        if (cfg.verifier.public_key_path)
        {
            std::ifstream file(*cfg.verifier.public_key_path);
            if (!file.is_open())
            {
                return std::unexpected(LicenseError(ErrorCode::IOError,
                                                    "Unable to open public key file: " + *cfg.verifier.public_key_path));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            pem = buffer.str();
            spdlog::debug("Using public key from {}", *cfg.verifier.public_key_path);
        }

        auto verifier = LicenseVerifier::from_pem(pem);
        if (!verifier)
        {
            return std::unexpected(verifier.error());
        }
        return LicenseClient(cfg.product.app_id, std::move(*verifier));
    }

    Result<std::string> LicenseClient::identifier_hash(const std::string &identifier)
    {
        if (crypto::trim(identifier).empty())
        {
            return std::unexpected(LicenseError(ErrorCode::MissingIdentifier, "PIB is missing"));
        }
        return crypto::hash_identifier(identifier);
    }

    Result<std::string> LicenseClient::generate_activation_code(const std::string &identifier, TimePoint now) const
    {
        auto hash = identifier_hash(identifier);
        if (!hash)
        {
            return std::unexpected(hash.error());
        }
        return pausaler::generate_activation_code(*hash, app_id_, timestamp::to_unix_seconds(now));
    }

    Result<VerificationVerdict> LicenseClient::check(const std::string &license,
                                                     const std::string &identifier,
                                                     TimePoint now) const
    {
        auto hash = identifier_hash(identifier);
        if (!hash)
        {
            return std::unexpected(hash.error());
        }

        std::string raw = crypto::trim(license);
        if (raw.empty())
        {
            VerificationVerdict verdict;
            verdict.reason = VerdictReason::InvalidFormat;
            return verdict;
        }

        return verifier_.verify(raw, *hash, now);
    }

} // namespace pausaler
