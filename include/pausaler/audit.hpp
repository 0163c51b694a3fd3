#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pausaler
{
    /**
     * One issuance attempt. Identifiers appear only as hashes.
     */
    struct AuditEvent
    {
        std::string ts;
        std::string action;
        std::string pib_hash;
        std::optional<std::string> license_type;
        std::optional<std::string> valid_until;
        std::string result; // "ok" or an error code name
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;
    };

    /** Writes audit events as single-line JSON through spdlog. */
    class AuditLogger
    {
    public:
        explicit AuditLogger(bool enabled = true);

        void log(const AuditEvent &event) const;

        bool enabled() const { return enabled_; }

    private:
        bool enabled_;
    };

    /** Current UTC time with millisecond precision, for audit records */
    std::string audit_timestamp(TimePoint now);

} // namespace pausaler
