#include "restjson/config.hpp"
#include "restjson/logging.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace restjson
{
    namespace
    {
        Result<std::uint64_t> parse_unsigned(const char *name, const std::string &text)
        {
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::unexpected(RestError::config(std::string("Invalid value for ") + name + ": " + text));
            }
            return value;
        }

        Result<RestJsonConfig> parse_toml(const toml::table &tbl, RestJsonConfig cfg)
        {
            if (auto server = tbl["server"].as_table())
            {
                if (auto address = (*server)["address"].value<std::string>())
                    cfg.server.address = *address;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    if (*port < 1 || *port > 65535)
                        return std::unexpected(RestError::config("server.port out of range: " + std::to_string(*port)));
                    cfg.server.port = static_cast<std::uint16_t>(*port);
                }
                if (auto threads = (*server)["threads"].value<int64_t>())
                {
                    if (*threads < 1)
                        return std::unexpected(RestError::config("server.threads must be positive"));
                    cfg.server.threads = static_cast<std::size_t>(*threads);
                }
                if (auto timeout = (*server)["read_timeout_seconds"].value<int64_t>())
                {
                    if (*timeout < 1)
                        return std::unexpected(RestError::config("server.read_timeout_seconds must be positive"));
                    cfg.server.read_timeout_seconds = static_cast<std::size_t>(*timeout);
                }
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto pattern = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *pattern;
            }

            if (auto responses = tbl["responses"].as_table())
            {
                if (auto escape = (*responses)["escape_html"].value<bool>())
                    cfg.responses.escape_html = *escape;
            }

            return cfg;
        }

    } // namespace

    Result<RestJsonConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(RestError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<RestJsonConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        RestJsonConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(RestError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());

        auto valid = validate(cfg);
        if (!valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(RestJsonConfig &cfg)
    {
        if (const char *address = std::getenv("RESTJSON_ADDRESS"))
            cfg.server.address = address;
        if (const char *port = std::getenv("RESTJSON_PORT"))
        {
            auto value = parse_unsigned("RESTJSON_PORT", port);
            if (!value)
                return std::unexpected(value.error());
            if (*value < 1 || *value > 65535)
                return std::unexpected(RestError::config(std::string("RESTJSON_PORT out of range: ") + port));
            cfg.server.port = static_cast<std::uint16_t>(*value);
        }
        if (const char *threads = std::getenv("RESTJSON_THREADS"))
        {
            auto value = parse_unsigned("RESTJSON_THREADS", threads);
            if (!value)
                return std::unexpected(value.error());
            cfg.server.threads = static_cast<std::size_t>(*value);
        }
        if (const char *level = std::getenv("RESTJSON_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    Result<void> ConfigLoader::validate(const RestJsonConfig &cfg)
    {
        if (cfg.server.threads == 0)
            return std::unexpected(RestError::config("server.threads must be positive"));
        auto level = logging::parse_level(cfg.logging.level);
        if (!level)
            return std::unexpected(level.error());
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const RestJsonConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {
            {"address", cfg.server.address},
            {"port", cfg.server.port},
            {"threads", cfg.server.threads},
            {"read_timeout_seconds", cfg.server.read_timeout_seconds}};
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        j["responses"] = {{"escape_html", cfg.responses.escape_html}};
        return j;
    }

} // namespace restjson
