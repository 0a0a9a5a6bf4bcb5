#pragma once

#include "restjson/json_text.hpp"
#include "restjson/response_sink.hpp"
#include "restjson/types.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace restjson
{
    inline constexpr std::string_view kContentType = "application/json";
    inline constexpr std::string_view kErrIsNilMessage = "error is nil";
    inline constexpr std::string_view kUnknownErrorMessage = "unknown error";

    /** Substituted for an absent error on the error path. */
    const RestError &err_is_nil();

    /**
     * An error whose message is a JSON document, for handlers that want to
     * return machine readable error bodies ({"code": ..., "description": ...}).
     */
    class JsonError : public std::exception
    {
    public:
        explicit JsonError(nlohmann::json payload);

        const char *what() const noexcept override;
        const nlohmann::json &payload() const { return payload_; }

    private:
        nlohmann::json payload_;
        std::string message_;
    };

    struct NormalizedError
    {
        std::string body;
        int status{500};
    };

    /**
     * Write pre-encoded JSON bytes. Sets Content-Type and status, then the body.
     * An absent or empty payload produces an empty body. The payload is not validated.
     */
    Result<std::size_t> content(ResponseSink &sink, std::optional<std::string_view> payload, int status);

    /**
     * Encode value and write it with content(). On SerializationError the sink
     * is left untouched.
     */
    Result<std::size_t> marshalled(ResponseSink &sink, const nlohmann::json &value, int status);

    template <typename T>
    Result<std::size_t> marshalled(ResponseSink &sink, const T &value, int status)
    {
        nlohmann::json j;
        try
        {
            j = value;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(RestError::serialization(std::string("JSON encode error: ") + e.what()));
        }
        return marshalled(sink, j, status);
    }

    template <typename T>
    Result<std::size_t> marshalled(ResponseSink &sink, const std::optional<T> &value, int status)
    {
        if (!value)
            return marshalled(sink, nlohmann::json(nullptr), status);
        return marshalled(sink, *value, status);
    }

    /**
     * Decide body and effective status for an error message.
     *
     * An absent message stands for a missing error: the body carries
     * kErrIsNilMessage and the status becomes 500 whatever was requested.
     * A message that already is valid JSON is used as is; anything else is
     * encoded as a JSON string.
     */
    NormalizedError normalize_error(std::optional<std::string_view> message, int status,
                                    const json::QuoteOptions &options = json::QuoteOptions{});

    /** Write err as a JSON error body. */
    Result<std::size_t> error(ResponseSink &sink, const std::exception &err, int status,
                              const json::QuoteOptions &options = json::QuoteOptions{});

    /**
     * Write a captured error as a JSON error body. A null pointer is the missing
     * error case (see normalize_error); a non std::exception payload renders as
     * kUnknownErrorMessage.
     */
    Result<std::size_t> error(ResponseSink &sink, const std::exception_ptr &err, int status,
                              const json::QuoteOptions &options = json::QuoteOptions{});

} // namespace restjson
