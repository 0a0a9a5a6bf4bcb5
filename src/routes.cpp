#include "restjson/routes.hpp"
#include "restjson/beast_sink.hpp"
#include "restjson/response.hpp"
#include <spdlog/spdlog.h>

namespace http = boost::beast::http;

namespace restjson
{
    namespace
    {
        JsonError invalid_body()
        {
            return JsonError(nlohmann::json{{"error", "request body is not valid JSON"}});
        }

        Result<std::size_t> dispatch(const Request &req, ResponseSink &sink, const json::QuoteOptions &quote)
        {
            if (req.method() != http::verb::get && req.method() != http::verb::post)
                return error(sink, RestError::invalid_input("method not allowed"), 405, quote);

            const auto &body = req.body();

            if (req.target() == "/health" && req.method() == http::verb::get)
                return marshalled(sink, nlohmann::json{{"status", "ok"}}, 200);

            if (req.target() == "/echo" && req.method() == http::verb::post)
            {
                if (!json::JsonText::is_valid(body))
                    return error(sink, invalid_body(), 400, quote);
                return content(sink, body, 200);
            }

            if (req.target() == "/errors/plain" && req.method() == http::verb::post)
                return error(sink, RestError::invalid_input(body), 422, quote);

            if (req.target() == "/errors/json" && req.method() == http::verb::post)
            {
                if (!json::JsonText::is_valid(body))
                    return error(sink, invalid_body(), 400, quote);
                return error(sink, JsonError(nlohmann::json::parse(body)), 422, quote);
            }

            if (req.target() == "/errors/nil" && req.method() == http::verb::get)
                return error(sink, std::exception_ptr{}, 418, quote);

            return error(sink, RestError::not_found("not found"), 404, quote);
        }
    } // namespace

    Response handle_request(const Request &req, const ResponseConfig &cfg)
    {
        json::QuoteOptions quote{cfg.escape_html};

        Response res{http::status::ok, req.version()};
        res.keep_alive(req.keep_alive());
        BeastResponseSink sink(res);

        auto written = dispatch(req, sink, quote);
        if (!written)
        {
            spdlog::error("failed to render response for {}: {}",
                          std::string(req.target()), written.error().what());
            res = Response{http::status::internal_server_error, req.version()};
            BeastResponseSink fallback(res);
            auto retried = error(fallback, written.error(), 500, quote);
            if (!retried)
                spdlog::error("failed to render fallback response: {}", retried.error().what());
        }

        res.prepare_payload();
        return res;
    }
}
