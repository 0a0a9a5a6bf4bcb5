#include "restjson/response.hpp"

namespace restjson
{
    namespace
    {
        constexpr int kInternalServerError = 500;

        std::string message_of(const std::exception_ptr &err)
        {
            try
            {
                std::rethrow_exception(err);
            }
            catch (const std::exception &e)
            {
                return e.what();
            }
            catch (...)
            {
                return std::string(kUnknownErrorMessage);
            }
        }

        Result<std::size_t> write_normalized(ResponseSink &sink, const NormalizedError &normalized)
        {
            return content(sink, normalized.body, normalized.status);
        }
    } // namespace

    const RestError &err_is_nil()
    {
        static const RestError sentinel = RestError::internal(std::string(kErrIsNilMessage));
        return sentinel;
    }

    JsonError::JsonError(nlohmann::json payload)
        : payload_(std::move(payload)),
          message_(payload_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))
    {
    }

    const char *JsonError::what() const noexcept
    {
        return message_.c_str();
    }

    Result<std::size_t> content(ResponseSink &sink, std::optional<std::string_view> payload, int status)
    {
        sink.set_header("Content-Type", kContentType);
        sink.set_status(status);
        if (!payload || payload->empty())
            return 0;
        return sink.write(*payload);
    }

    Result<std::size_t> marshalled(ResponseSink &sink, const nlohmann::json &value, int status)
    {
        auto encoded = json::JsonText::encode(value);
        if (!encoded)
            return std::unexpected(encoded.error());
        return content(sink, *encoded, status);
    }

    NormalizedError normalize_error(std::optional<std::string_view> message, int status,
                                    const json::QuoteOptions &options)
    {
        NormalizedError out;
        out.status = status;

        if (!message)
        {
            message = err_is_nil().what();
            out.status = kInternalServerError;
        }

        if (json::JsonText::is_valid(*message))
            out.body = std::string(*message);
        else
            out.body = json::JsonText::quote(*message, options);
        return out;
    }

    Result<std::size_t> error(ResponseSink &sink, const std::exception &err, int status,
                              const json::QuoteOptions &options)
    {
        return write_normalized(sink, normalize_error(std::string_view(err.what()), status, options));
    }

    Result<std::size_t> error(ResponseSink &sink, const std::exception_ptr &err, int status,
                              const json::QuoteOptions &options)
    {
        if (!err)
            return write_normalized(sink, normalize_error(std::nullopt, status, options));
        auto message = message_of(err);
        return write_normalized(sink, normalize_error(message, status, options));
    }

} // namespace restjson
