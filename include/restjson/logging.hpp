#pragma once

#include "restjson/config.hpp"
#include "restjson/types.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace restjson::logging
{
    /** Map trace|debug|info|warn|error|critical|off to a spdlog level. */
    Result<spdlog::level::level_enum> parse_level(const std::string &name);

    /** Apply level and pattern to the default spdlog logger. */
    Result<void> configure(const LoggingConfig &cfg);
}
