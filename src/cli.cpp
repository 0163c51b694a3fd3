#include "pausaler/cli.hpp"
#include "pausaler/config.hpp"
#include "pausaler/license_client.hpp"
#include "pausaler/license_issuer.hpp"
#include "pausaler/timestamp.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include <map>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pausaler::cli
{
	namespace
	{
		constexpr const char *kDefaultConfigPath = "pausaler.toml";

		// Licenses and keys go to stdout; diagnostics go to stderr.
		bool load_config(const std::string &path, LicensingConfig &cfg)
		{
			spdlog::set_default_logger(spdlog::stderr_color_mt("pausaler"));

			auto loaded = ConfigLoader::load_or_defaults(path);
			if (!loaded)
			{
				std::cerr << loaded.error().what() << std::endl;
				return false;
			}
			auto logging = configure_logging(loaded->logging);
			if (!logging)
			{
				std::cerr << logging.error().what() << std::endl;
				return false;
			}
			cfg = *loaded;
			return true;
		}
	} // namespace

	int run_issuer(int argc, char *argv[])
	{
		CLI::App app{"Pausaler offline license issuer"};
		app.require_subcommand(1);

		std::string config_path{kDefaultConfigPath};
		app.add_option("--config", config_path, "Path to config TOML");

		std::string activation_code;
		LicenseType license_type{LicenseType::Yearly};
		const std::map<std::string, LicenseType> type_names{
			{"yearly", LicenseType::Yearly},
			{"lifetime", LicenseType::Lifetime}};
		auto gen_cmd = app.add_subcommand("generate", "Issue a signed license for an activation code");
		gen_cmd->add_option("--activation-code", activation_code, "Activation code from the user's installation")->required();
		gen_cmd->add_option("--type", license_type, "License class: yearly or lifetime")
			->required()
			->transform(CLI::CheckedTransformer(type_names, CLI::ignore_case));

		auto pub_cmd = app.add_subcommand("public-key", "Print the verifying key as SPKI PEM");
		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective config as JSON");

		CLI11_PARSE(app, argc, argv);

		LicensingConfig cfg;
		if (!load_config(config_path, cfg))
		{
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(cfg).dump(2) << std::endl;
			return 0;
		}

		auto issuer = LicenseIssuer::from_seed_hex(cfg.effective_signing_seed_hex(),
												   cfg.product.app_id,
												   AuditLogger(cfg.logging.audit_enabled));
		if (!issuer)
		{
			std::cerr << issuer.error().what() << std::endl;
			return 1;
		}

		if (*pub_cmd)
		{
			std::cout << issuer->public_key_pem();
			return 0;
		}

		if (*gen_cmd)
		{
			auto license = issuer->issue(activation_code, license_type, std::chrono::system_clock::now());
			if (!license)
			{
				std::cerr << license.error().what() << std::endl;
				return 1;
			}
			std::cout << *license << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

	int run_client(int argc, char *argv[])
	{
		CLI::App app{"Pausaler license client"};
		app.require_subcommand(1);

		std::string config_path{kDefaultConfigPath};
		app.add_option("--config", config_path, "Path to config TOML");

		std::string pib;

		auto act_cmd = app.add_subcommand("activation-code", "Generate an activation code for a company PIB");
		act_cmd->add_option("--pib", pib, "Company tax identifier")->required();

		std::string license;
		std::string now_text;
		auto check_cmd = app.add_subcommand("check", "Verify a license for a company PIB");
		check_cmd->add_option("--license", license, "License string")->required();
		check_cmd->add_option("--pib", pib, "Company tax identifier")->required();
		check_cmd->add_option("--now", now_text, "Evaluate at this RFC3339 time instead of the clock");

		auto hash_cmd = app.add_subcommand("hash", "Print the identifier hash of a PIB");
		hash_cmd->add_option("--pib", pib, "Company tax identifier")->required();

		CLI11_PARSE(app, argc, argv);

		LicensingConfig cfg;
		if (!load_config(config_path, cfg))
		{
			return 1;
		}

		if (*hash_cmd)
		{
			auto hash = LicenseClient::identifier_hash(pib);
			if (!hash)
			{
				std::cerr << hash.error().what() << std::endl;
				return 1;
			}
			std::cout << *hash << std::endl;
			return 0;
		}

		auto client = LicenseClient::from_config(cfg);
		if (!client)
		{
			std::cerr << client.error().what() << std::endl;
			return 1;
		}

		if (*act_cmd)
		{
			auto code = client->generate_activation_code(pib, std::chrono::system_clock::now());
			if (!code)
			{
				std::cerr << code.error().what() << std::endl;
				return 1;
			}
			std::cout << *code << std::endl;
			return 0;
		}

		if (*check_cmd)
		{
			TimePoint now = std::chrono::system_clock::now();
			if (!now_text.empty())
			{
				auto parsed = timestamp::parse_rfc3339(now_text);
				if (!parsed)
				{
					std::cerr << parsed.error().what() << std::endl;
					return 1;
				}
				now = *parsed;
			}

			auto verdict = client->check(license, pib, now);
			if (!verdict)
			{
				if (verdict.error().code == ErrorCode::MissingIdentifier)
				{
					std::cerr << verdict.error().what() << std::endl;
					return 1;
				}
				std::cerr << "License is corrupted or tampered with ("
						  << error_code_to_string(verdict.error().code) << "): "
						  << verdict.error().what() << std::endl;
				return 3;
			}
			std::cout << verdict->to_json().dump(2) << std::endl;
			return verdict->is_valid ? 0 : 2;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace pausaler::cli
