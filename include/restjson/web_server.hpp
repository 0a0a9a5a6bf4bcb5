#pragma once

#include "restjson/config.hpp"
#include <cstdint>
#include <memory>

namespace restjson
{
    /**
     * Minimal HTTP server using Boost.Beast that serves the routes of
     * handle_request() on a pool of threads sharing one io_context.
     */
    class WebServer
    {
    public:
        explicit WebServer(const RestJsonConfig &cfg = RestJsonConfig{});
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop. Safe to call from any thread. */
        void stop();

        /** Port the acceptor listens on, 0 until run() has bound it. */
        std::uint16_t bound_port() const;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
