#pragma once

#include "restjson/response_sink.hpp"
#include <boost/beast/http.hpp>

namespace restjson
{
    /**
     * Renders into a Boost.Beast string-body response. Callers run
     * prepare_payload() on the response once rendering is done.
     */
    class BeastResponseSink : public ResponseSink
    {
    public:
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        explicit BeastResponseSink(Response &res);

        void set_header(std::string_view key, std::string_view value) override;
        void set_status(int code) override;
        Result<std::size_t> write(std::string_view bytes) override;

    private:
        Response &res_;
        bool status_set_{false};
    };
}
