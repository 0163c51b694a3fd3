#include "pausaler/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>

namespace pausaler
{
    namespace
    {
        // Development signing seed. Production issuers set PAUSALER_SIGNING_SEED
        // or [issuer] signing_seed_hex.
        constexpr const char *kDevSigningSeedHex =
            "c590af4308cc0f6a1a4faccf7c05ff00b3d7d4d38a9ad52b1af10f0c6b3a3f10";

        LicensingConfig parse_toml(const toml::table &tbl, LicensingConfig cfg)
        {
            if (auto product = tbl["product"].as_table())
            {
                if (auto app_id = (*product)["app_id"].value<std::string>())
                    cfg.product.app_id = *app_id;
            }

            if (auto issuer = tbl["issuer"].as_table())
            {
                if (auto seed = (*issuer)["signing_seed_hex"].value<std::string>())
                    cfg.issuer.signing_seed_hex = *seed;
            }

            if (auto verifier = tbl["verifier"].as_table())
            {
                if (auto path = (*verifier)["public_key_path"].value<std::string>())
                    cfg.verifier.public_key_path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto audit = (*logging)["audit_enabled"].value<bool>())
                    cfg.logging.audit_enabled = *audit;
            }

            return cfg;
        }
    } // namespace

    std::string LicensingConfig::effective_signing_seed_hex() const
    {
        return issuer.signing_seed_hex.value_or(kDevSigningSeedHex);
    }

    Result<LicensingConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(LicenseError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<LicensingConfig> ConfigLoader::load_or_defaults(const std::string &path)
    {
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec))
        {
            LicensingConfig cfg{};
            auto env = apply_env_overrides(cfg);
            if (!env)
                return std::unexpected(env.error());
            return cfg;
        }
        return load(path);
    }

    Result<LicensingConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        LicensingConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(LicenseError::config(std::string("Failed to parse TOML: ") + std::string(e.description())));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(LicensingConfig &cfg)
    {
        if (const char *app_id = std::getenv("PAUSALER_APP_ID"))
            cfg.product.app_id = app_id;
        if (const char *seed = std::getenv("PAUSALER_SIGNING_SEED"))
            cfg.issuer.signing_seed_hex = seed;
        if (const char *path = std::getenv("PAUSALER_PUBLIC_KEY_PATH"))
            cfg.verifier.public_key_path = path;
        if (const char *level = std::getenv("PAUSALER_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit = std::getenv("PAUSALER_AUDIT_ENABLED"))
            cfg.logging.audit_enabled = std::string(audit) != "0";

        if (cfg.product.app_id.empty())
        {
            return std::unexpected(LicenseError::config("product.app_id must not be empty"));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const LicensingConfig &cfg)
    {
        nlohmann::json j;
        j["product"] = {{"app_id", cfg.product.app_id}};
        j["issuer"] = {{"has_signing_seed", cfg.issuer.signing_seed_hex.has_value()}};
        j["verifier"] = {{"public_key_path", cfg.verifier.public_key_path ? nlohmann::json(*cfg.verifier.public_key_path) : nlohmann::json(nullptr)}};
        j["logging"] = {{"level", cfg.logging.level}, {"audit_enabled", cfg.logging.audit_enabled}};
        return j;
    }

    Result<void> configure_logging(const LoggingConfig &cfg)
    {
        static const char *kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
        bool known = false;
        for (const char *name : kLevels)
        {
            if (cfg.level == name)
                known = true;
        }
        if (!known)
        {
            return std::unexpected(LicenseError::config("Unknown log level: " + cfg.level));
        }
        spdlog::set_level(spdlog::level::from_str(cfg.level));
        return {};
    }

} // namespace pausaler
