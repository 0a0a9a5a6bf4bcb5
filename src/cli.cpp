#include "restjson/cli.hpp"
#include "restjson/config.hpp"
#include "restjson/json_text.hpp"
#include "restjson/logging.hpp"
#include "restjson/response.hpp"
#include "restjson/web_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace restjson::cli
{

	namespace
	{
		Result<RestJsonConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_string("");
			return ConfigLoader::load(path);
		}

		void report(const RestError &err)
		{
			std::cerr << error_code_to_string(err.code) << ": " << err.what() << std::endl;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"restjson - JSON response rendering for HTTP services"};

		std::string config_path;
		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the demo HTTP server");
		serve_cmd->add_option("--config", config_path, "Path to config TOML");
		serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads (overrides config)");

		std::string print_path;
		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", print_path, "Config path")->required();

		std::string error_message;
		bool nil_error{false};
		int error_status{500};
		bool no_escape_html{false};
		auto render_cmd = app.add_subcommand("render-error", "Print the status and body the error path produces");
		auto message_opt = render_cmd->add_option("--message", error_message, "Error message (plain text or JSON)");
		auto nil_flag = render_cmd->add_flag("--nil", nil_error, "Render a missing error");
		message_opt->excludes(nil_flag);
		render_cmd->add_option("--status", error_status, "Requested HTTP status");
		render_cmd->add_flag("--no-escape-html", no_escape_html, "Keep <, > and & literal");

		std::string validate_path;
		auto validate_cmd = app.add_subcommand("validate", "Check that a file holds valid JSON");
		validate_cmd->add_option("--file", validate_path, "JSON file path")->required();

		CLI11_PARSE(app, argc, argv);

		if (*serve_cmd)
		{
			auto cfg = load_config(config_path);
			if (!cfg)
			{
				report(cfg.error());
				return 1;
			}
			if (serve_port)
				cfg->server.port = *serve_port;
			if (serve_threads)
				cfg->server.threads = *serve_threads;
			if (cfg->server.threads == 0)
			{
				std::cerr << "--threads must be positive" << std::endl;
				return 1;
			}

			auto logged = logging::configure(cfg->logging);
			if (!logged)
			{
				report(logged.error());
				return 1;
			}

			try
			{
				WebServer server(*cfg);
				server.run();
			}
			catch (const std::exception &e)
			{
				spdlog::critical("server stopped: {}", e.what());
				return 1;
			}
			return 0;
		}

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(print_path);
			if (!cfg)
			{
				report(cfg.error());
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*render_cmd)
		{
			json::QuoteOptions options{!no_escape_html};
			std::optional<std::string_view> message;
			if (!nil_error)
				message = error_message;
			auto normalized = normalize_error(message, error_status, options);
			std::cout << normalized.status << "\n"
					  << normalized.body << std::endl;
			return 0;
		}

		if (*validate_cmd)
		{
			std::ifstream f(validate_path);
			if (!f.is_open())
			{
				std::cerr << "Unable to open file: " << validate_path << std::endl;
				return 1;
			}
			std::stringstream buffer;
			buffer << f.rdbuf();
			if (!json::JsonText::is_valid(buffer.str()))
			{
				std::cerr << "invalid JSON" << std::endl;
				return 2;
			}
			std::cout << "valid JSON" << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace restjson::cli
