#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pausaler
{

    inline constexpr const char *kDefaultAppId = "com.dstankovski.pausaler-app";

    struct ProductConfig
    {
        std::string app_id{kDefaultAppId};
    };

    struct IssuerConfig
    {
        // Hex-encoded 32-byte Ed25519 seed. Unset means the development seed.
        std::optional<std::string> signing_seed_hex;
    };

    struct VerifierConfig
    {
        // Overrides the embedded public key (development builds only)
        std::optional<std::string> public_key_path;
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        bool audit_enabled{true};
    };

    struct LicensingConfig
    {
        ProductConfig product{};
        IssuerConfig issuer{};
        VerifierConfig verifier{};
        LoggingConfig logging{};

        /** Seed to sign with: configured value or the development seed */
        std::string effective_signing_seed_hex() const;
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     * Environment: PAUSALER_APP_ID, PAUSALER_SIGNING_SEED,
     * PAUSALER_PUBLIC_KEY_PATH, PAUSALER_LOG_LEVEL, PAUSALER_AUDIT_ENABLED.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<LicensingConfig> load(const std::string &path);

        /** Like load, but a missing file yields defaults plus environment */
        static Result<LicensingConfig> load_or_defaults(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<LicensingConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection; the seed is redacted. */
        static nlohmann::json to_json(const LicensingConfig &cfg);

    private:
        static Result<void> apply_env_overrides(LicensingConfig &cfg);
    };

    /**
     * Set the spdlog default level from config. Unknown level names fail
     * with ErrorCode::ConfigError.
     */
    Result<void> configure_logging(const LoggingConfig &cfg);

} // namespace pausaler
