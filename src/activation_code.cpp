#include "pausaler/activation_code.hpp"
#include "pausaler/crypto.hpp"

namespace pausaler
{

    nlohmann::ordered_json ActivationCodePayload::to_json() const
    {
        nlohmann::ordered_json j;
        j["pib_hash"] = pib_hash;
        j["issued_at"] = issued_at;
        j["nonce"] = nonce;
        j["app_id"] = app_id;
        return j;
    }

    Result<std::string> generate_activation_code(
        const std::string &pib_hash,
        const std::string &app_id,
        int64_t issued_at)
    {
        ActivationCodePayload payload{
            pib_hash,
            issued_at,
            crypto::Base64::encode_url_safe(crypto::SecureRandom::generate_bytes(kActivationNonceBytes)),
            app_id};

        try
        {
            std::string json = payload.to_json().dump();
            return crypto::Base64::encode_url_safe(crypto::Bytes(json.begin(), json.end()));
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(LicenseError::activation(std::string("failed to serialize activation code: ") + e.what()));
        }
    }

    Result<ActivationCodePayload> decode_activation_code(const std::string &code)
    {
        auto bytes = crypto::Base64::decode_url_safe(crypto::trim(code));
        if (!bytes)
        {
            return std::unexpected(LicenseError::activation(std::string("invalid activation code base64url: ") + bytes.error().what()));
        }

        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(bytes->begin(), bytes->end());
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(LicenseError::activation(std::string("invalid activation code json: ") + e.what()));
        }

        if (!j.is_object())
        {
            return std::unexpected(LicenseError::activation("invalid activation code json: expected an object"));
        }

        for (const char *field : {"pib_hash", "issued_at", "nonce", "app_id"})
        {
            if (!j.contains(field))
            {
                return std::unexpected(LicenseError::missing_field(std::string("activation code missing ") + field));
            }
        }

        if (!j["pib_hash"].is_string() || !j["nonce"].is_string() || !j["app_id"].is_string() ||
            !j["issued_at"].is_number_integer())
        {
            return std::unexpected(LicenseError::activation("invalid activation code json: wrong field type"));
        }

        ActivationCodePayload payload;
        payload.pib_hash = j["pib_hash"].get<std::string>();
        payload.issued_at = j["issued_at"].get<int64_t>();
        payload.nonce = j["nonce"].get<std::string>();
        payload.app_id = j["app_id"].get<std::string>();

        if (payload.pib_hash.empty())
        {
            return std::unexpected(LicenseError::missing_field("activation code missing pib_hash"));
        }
        if (payload.issued_at <= 0)
        {
            return std::unexpected(LicenseError::missing_field("activation code has invalid issued_at"));
        }
        if (payload.nonce.empty())
        {
            return std::unexpected(LicenseError::missing_field("activation code missing nonce"));
        }
        if (payload.app_id.empty())
        {
            return std::unexpected(LicenseError::missing_field("activation code missing app_id"));
        }

        return payload;
    }

} // namespace pausaler
