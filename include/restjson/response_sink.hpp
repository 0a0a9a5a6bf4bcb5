#pragma once

#include "types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace restjson
{
    /**
     * An HTTP response in progress: headers, a status line and a body writer.
     * The status must be set before the first body byte; implementations honor
     * only the first status they receive.
     */
    class ResponseSink
    {
    public:
        virtual ~ResponseSink() = default;

        virtual void set_header(std::string_view key, std::string_view value) = 0;
        virtual void set_status(int code) = 0;

        /** Append bytes to the body; IOError when the transport rejects them. */
        virtual Result<std::size_t> write(std::string_view bytes) = 0;
    };

    /**
     * In-memory sink that records what a handler produced, for tests and tooling.
     * Header names are case-insensitive. A write without a prior set_status
     * implies 200.
     */
    class ResponseRecorder : public ResponseSink
    {
    public:
        ResponseRecorder();

        void set_header(std::string_view key, std::string_view value) override;
        void set_status(int code) override;
        Result<std::size_t> write(std::string_view bytes) override;

        /** Make every following write fail with an IOError carrying message. */
        void fail_writes(std::string message);

        int status() const { return status_; }
        bool wrote_header() const { return wrote_header_; }
        const std::string &body() const { return body_; }

        /** Header as sent with the status line, or as currently set if no status yet. */
        std::optional<std::string> header(std::string_view key) const;

    private:
        struct CaseInsensitiveLess
        {
            bool operator()(const std::string &a, const std::string &b) const;
        };
        using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

        HeaderMap headers_;
        HeaderMap sent_headers_;
        int status_{200};
        bool wrote_header_{false};
        std::string body_;
        std::optional<std::string> write_failure_;
    };
}
