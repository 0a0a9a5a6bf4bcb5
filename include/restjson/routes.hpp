#pragma once

#include "restjson/beast_sink.hpp"
#include "restjson/config.hpp"
#include <boost/beast/http.hpp>

namespace restjson
{
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = BeastResponseSink::Response;

    /**
     * Route a request of the demo server. Every response is rendered through
     * content(), marshalled() or error().
     *
     *   GET  /health        {"status":"ok"}
     *   POST /echo          request body when it is valid JSON, 400 otherwise
     *   POST /errors/plain  request body as a plain-text error, 422
     *   POST /errors/json   request body as a structured JSON error, 422
     *   GET  /errors/nil    missing error, forced to 500
     */
    Response handle_request(const Request &req, const ResponseConfig &cfg = ResponseConfig{});
}
