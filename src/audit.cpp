#include "pausaler/audit.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <spdlog/spdlog.h>

namespace pausaler
{

    std::string audit_timestamp(TimePoint now)
    {
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        char date[24];
        std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);
        char out[32];
        std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(ms.count()));
        return out;
    }

    nlohmann::json AuditEvent::to_json() const
    {
        nlohmann::json j{{"ts", ts},
                         {"action", action},
                         {"pib_hash", pib_hash},
                         {"result", result},
                         {"details", details}};
        j["license_type"] = license_type ? nlohmann::json(*license_type) : nlohmann::json(nullptr);
        j["valid_until"] = valid_until ? nlohmann::json(*valid_until) : nlohmann::json(nullptr);
        return j;
    }

    AuditLogger::AuditLogger(bool enabled) : enabled_(enabled) {}

    void AuditLogger::log(const AuditEvent &event) const
    {
        if (!enabled_)
            return;
        spdlog::info("audit {}", event.to_json().dump());
    }

} // namespace pausaler
