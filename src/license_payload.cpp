#include "pausaler/license_payload.hpp"

namespace pausaler
{

    nlohmann::ordered_json LicensePayload::to_json() const
    {
        nlohmann::ordered_json j;
        j["license_type"] = license_type_to_string(license_type);
        j["valid_from"] = valid_from;
        if (valid_until)
            j["valid_until"] = *valid_until;
        j["pib_hash"] = pib_hash;
        return j;
    }

    Result<crypto::Bytes> LicensePayload::serialize() const
    {
        try
        {
            std::string json = to_json().dump();
            return crypto::Bytes(json.begin(), json.end());
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(LicenseError::payload(std::string("failed to serialize license payload: ") + e.what()));
        }
    }

    Result<LicensePayload> LicensePayload::parse(const crypto::Bytes &bytes)
    {
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(bytes.begin(), bytes.end());
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(LicenseError::payload(std::string("invalid payload json: ") + e.what()));
        }

        if (!j.is_object())
        {
            return std::unexpected(LicenseError::payload("invalid payload json: expected an object"));
        }

        for (const char *field : {"license_type", "valid_from", "pib_hash"})
        {
            if (!j.contains(field))
            {
                return std::unexpected(LicenseError::payload(std::string("invalid payload json: missing field ") + field));
            }
            if (!j[field].is_string())
            {
                return std::unexpected(LicenseError::payload(std::string("invalid payload json: ") + field + " must be a string"));
            }
        }

        LicensePayload payload;
        auto type = license_type_from_string(j["license_type"].get<std::string>());
        if (!type)
        {
            return std::unexpected(LicenseError::payload("invalid payload json: unknown license_type " + j["license_type"].get<std::string>()));
        }
        payload.license_type = *type;
        payload.valid_from = j["valid_from"].get<std::string>();
        payload.pib_hash = j["pib_hash"].get<std::string>();

        // null is accepted as absent
        if (j.contains("valid_until") && !j["valid_until"].is_null())
        {
            if (!j["valid_until"].is_string())
            {
                return std::unexpected(LicenseError::payload("invalid payload json: valid_until must be a string"));
            }
            payload.valid_until = j["valid_until"].get<std::string>();
        }

        return payload;
    }

} // namespace pausaler
