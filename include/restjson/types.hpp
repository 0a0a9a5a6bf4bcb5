#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace restjson
{

    /**
     * Error categories for restjson operations
     */
    enum class ErrorCode
    {
        IOError,
        SerializationError,
        ConfigError,
        InvalidInput,
        NotFound,
        InternalError
    };

    /**
     * Convert ErrorCode to string representation
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::SerializationError:
            return "SerializationError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    /**
     * restjson error with code and message
     */
    class RestError : public std::runtime_error
    {
    public:
        ErrorCode code;

        RestError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static RestError io(const std::string &msg)
        {
            return RestError(ErrorCode::IOError, msg);
        }

        static RestError serialization(const std::string &msg)
        {
            return RestError(ErrorCode::SerializationError, msg);
        }

        static RestError config(const std::string &msg)
        {
            return RestError(ErrorCode::ConfigError, msg);
        }

        static RestError invalid_input(const std::string &msg)
        {
            return RestError(ErrorCode::InvalidInput, msg);
        }

        static RestError not_found(const std::string &msg)
        {
            return RestError(ErrorCode::NotFound, msg);
        }

        static RestError internal(const std::string &msg)
        {
            return RestError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, RestError>;

} // namespace restjson
