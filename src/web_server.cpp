#include "restjson/web_server.hpp"
#include "restjson/routes.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace restjson
{
    class WebServer::Impl
    {
    public:
        explicit Impl(RestJsonConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.server.threads)),
              acceptor_(ioc_)
        {
        }

        ~Impl()
        {
            stop();
            beast::error_code ec;
            acceptor_.close(ec);
        }

        void run()
        {
            beast::error_code ec;
            auto address = net::ip::make_address(cfg_.server.address, ec);
            if (ec)
                throw beast::system_error{ec};
            tcp::endpoint endpoint{address, cfg_.server.port};

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            port_ = acceptor_.local_endpoint().port();
            spdlog::info("listening on {}:{} with {} threads",
                         cfg_.server.address, port_.load(), cfg_.server.threads);

            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.server.threads);
            for (std::size_t i = 0; i < cfg_.server.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        // the acceptor belongs to the io_context threads, so only the context is touched here
        void stop()
        {
            ioc_.stop();
        }

        std::uint16_t bound_port() const
        {
            return port_.load();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (ec)
            {
                spdlog::warn("accept failed: {}", ec.message());
            }
            else
            {
                std::make_shared<Session>(std::move(socket), cfg_)->run();
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, const RestJsonConfig &cfg)
                : stream_(std::move(socket)),
                  buffer_(),
                  cfg_(cfg)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(cfg_.server.read_timeout_seconds));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    spdlog::warn("read failed: {}", ec.message());
                    return;
                }

                res_ = handle_request(req_, cfg_.responses);
                spdlog::info("{} {} -> {} ({} bytes)",
                             std::string(req_.method_string()),
                             std::string(req_.target()),
                             res_.result_int(),
                             res_.body().size());
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    spdlog::warn("write failed: {}", ec.message());
                    return;
                }
                if (res_.keep_alive())
                {
                    return do_read();
                }
                do_close();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            Request req_;
            Response res_;
            const RestJsonConfig &cfg_;
        };

        RestJsonConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::atomic<std::uint16_t> port_{0};
    };

    WebServer::WebServer(const RestJsonConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }
    std::uint16_t WebServer::bound_port() const { return impl_->bound_port(); }

} // namespace restjson
