#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <thread>

namespace restjson
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        std::size_t read_timeout_seconds{30};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] %v"};
    };

    struct ResponseConfig
    {
        bool escape_html{true};
    };

    struct RestJsonConfig
    {
        ServerConfig server{};
        LoggingConfig logging{};
        ResponseConfig responses{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides
     * (RESTJSON_ADDRESS, RESTJSON_PORT, RESTJSON_THREADS, RESTJSON_LOG_LEVEL).
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<RestJsonConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<RestJsonConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const RestJsonConfig &cfg);

    private:
        static Result<void> apply_env_overrides(RestJsonConfig &cfg);
        static Result<void> validate(const RestJsonConfig &cfg);
    };

} // namespace restjson
