#include "courier/relay/http_server.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/json_codec.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <deque>
#include <future>
#include <memory>

namespace courier::relay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using protocol::ErrorMessages;
using protocol::configuration::RelayConfig;
using protocol::utilities::JsonCodec;

namespace {

    /**
     * @brief Server side of one WebSocket push connection
     *
     * Every member except the atomics is touched only on the stream's
     * strand. Send must not be called from that strand: it blocks until
     * the frame has been written or the push timeout expires. A push that
     * misses its deadline tears the connection down, so a consumer that
     * stops reading cannot hold a worker for longer than one timeout.
     */
    class WebSocketChannel final : public IPushChannel,
                                   public std::enable_shared_from_this<WebSocketChannel> {
    public:
        WebSocketChannel(tcp::socket&& socket, std::string client_id,
                         RelayService& service, net::thread_pool& workers,
                         const std::chrono::milliseconds push_timeout)
            : ws_(std::move(socket))
            , client_id_(std::move(client_id))
            , service_(service)
            , workers_(workers)
            , push_timeout_(push_timeout) {
        }

        void Accept(http::request<http::string_body> upgrade) {
            upgrade_ = std::move(upgrade);
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, "courier-relay");
            }));
            ws_.async_accept(upgrade_, beast::bind_front_handler(
                &WebSocketChannel::OnAccept, shared_from_this()));
        }

        Result<Unit, RelayFailure> Send(const std::string& text) override {
            if (!IsOpen()) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::Transport(
                    compat::format("Connection of {} is closed", client_id_)));
            }
            auto pending = std::make_shared<PendingWrite>();
            pending->text = text;
            auto written = pending->done.get_future();
            net::post(ws_.get_executor(), [self = shared_from_this(), pending]() {
                self->Enqueue(pending);
            });
            if (written.wait_for(push_timeout_) == std::future_status::timeout) {
                Abort();
                return Result<Unit, RelayFailure>::Err(RelayFailure::Transport(compat::format(
                    "Push to {} timed out after {} ms", client_id_, push_timeout_.count())));
            }
            try {
                if (const beast::error_code ec = written.get(); ec) {
                    return Result<Unit, RelayFailure>::Err(RelayFailure::Transport(
                        compat::format("Push to {} failed: {}", client_id_, ec.message())));
                }
            } catch (const std::future_error& ex) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::Transport(
                    compat::format("Push to {} abandoned: {}", client_id_, ex.what())));
            }
            return Result<Unit, RelayFailure>::Ok(protocol::unit);
        }

        void Close(const uint16_t code, std::string_view reason) override {
            net::post(ws_.get_executor(), [self = shared_from_this(), code, reason = std::string(reason)]() {
                if (!self->open_ || self->closing_) {
                    return;
                }
                self->closing_ = true;
                self->close_reason_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
                if (self->queue_.empty()) {
                    self->DoClose();
                }
            });
        }

        [[nodiscard]] bool IsOpen() const override {
            return open_ && !closing_;
        }

    private:
        struct PendingWrite {
            std::string text;
            std::promise<beast::error_code> done;
        };

        // Closing the socket fails the pending write and ends the read loop,
        // which hands the channel back to the service through Disconnect.
        void Abort() {
            if (!open_.exchange(false)) {
                return;
            }
            spdlog::warn("Dropping stalled connection of {}", client_id_);
            net::post(ws_.get_executor(), [self = shared_from_this()]() {
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws_).socket().close(ignored);
            });
        }

        void OnAccept(const beast::error_code ec) {
            if (ec) {
                spdlog::warn("WebSocket handshake with {} failed: {}", client_id_, ec.message());
                return;
            }
            open_ = true;
            DoRead();
            net::post(workers_, [self = shared_from_this()]() {
                auto connected = self->service_.Connect(self->client_id_, self);
                if (connected.IsErr()) {
                    spdlog::warn("Rejected connection of {}: {}",
                                 self->client_id_, connected.UnwrapErr().message);
                    self->Close(static_cast<uint16_t>(websocket::close_code::policy_error),
                                connected.UnwrapErr().message);
                }
            });
        }

        void DoRead() {
            ws_.async_read(buffer_, beast::bind_front_handler(
                &WebSocketChannel::OnRead, shared_from_this()));
        }

        // Inbound frames carry nothing; the read loop only detects the close.
        void OnRead(const beast::error_code ec, std::size_t) {
            if (ec) {
                open_ = false;
                if (ec != websocket::error::closed) {
                    spdlog::debug("Connection of {} ended: {}", client_id_, ec.message());
                }
                net::post(workers_, [self = shared_from_this()]() {
                    self->service_.Disconnect(self->client_id_, self.get());
                });
                return;
            }
            buffer_.consume(buffer_.size());
            DoRead();
        }

        void Enqueue(const std::shared_ptr<PendingWrite>& pending) {
            if (!open_ || closing_) {
                pending->done.set_value(net::error::operation_aborted);
                return;
            }
            queue_.push_back(pending);
            if (queue_.size() == 1) {
                WriteNext();
            }
        }

        void WriteNext() {
            ws_.text(true);
            ws_.async_write(net::buffer(queue_.front()->text), beast::bind_front_handler(
                &WebSocketChannel::OnWrite, shared_from_this()));
        }

        void OnWrite(const beast::error_code ec, std::size_t) {
            queue_.front()->done.set_value(ec);
            queue_.pop_front();
            if (ec) {
                open_ = false;
                for (const auto& pending : queue_) {
                    pending->done.set_value(ec);
                }
                queue_.clear();
                return;
            }
            if (!queue_.empty()) {
                WriteNext();
            } else if (closing_) {
                DoClose();
            }
        }

        void DoClose() {
            ws_.async_close(close_reason_, [self = shared_from_this()](const beast::error_code ec) {
                self->open_ = false;
                if (ec) {
                    spdlog::debug("Close of {} failed: {}", self->client_id_, ec.message());
                }
            });
        }

        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> upgrade_;
        std::string client_id_;
        RelayService& service_;
        net::thread_pool& workers_;
        std::chrono::milliseconds push_timeout_;
        std::deque<std::shared_ptr<PendingWrite>> queue_;
        websocket::close_reason close_reason_;
        std::atomic<bool> open_{false};
        std::atomic<bool> closing_{false};
    };

    class HttpSession final : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(tcp::socket&& socket, RequestRouter& router, RelayService& service,
                    net::thread_pool& workers, const std::chrono::milliseconds push_timeout)
            : stream_(std::move(socket))
            , router_(router)
            , service_(service)
            , workers_(workers)
            , push_timeout_(push_timeout) {
        }

        void Start() {
            net::dispatch(stream_.get_executor(), beast::bind_front_handler(
                &HttpSession::DoRead, shared_from_this()));
        }

    private:
        void DoRead() {
            request_ = {};
            http::async_read(stream_, buffer_, request_, beast::bind_front_handler(
                &HttpSession::OnRead, shared_from_this()));
        }

        void OnRead(beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                return;
            }
            if (ec) {
                spdlog::debug("HTTP read failed: {}", ec.message());
                return;
            }
            if (websocket::is_upgrade(request_)) {
                HandleUpgrade();
                return;
            }
            HttpRequest request{
                std::string(request_.method_string()),
                std::string(request_.target()),
                request_.body()};
            net::post(workers_, [self = shared_from_this(), request = std::move(request)]() {
                auto response = self->router_.Handle(request);
                net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
                    self->Write(std::move(response), self->request_.keep_alive());
                });
            });
        }

        void HandleUpgrade() {
            const std::string target(request_.target());
            if (RequestRouter::PathOf(target) != "/ws") {
                Write(Rejection(http::status::not_found, ErrorMessages::NOT_FOUND), false);
                return;
            }
            const auto client_id = RequestRouter::QueryParameter(target, "client_id");
            if (!client_id || client_id->empty()) {
                Write(Rejection(http::status::bad_request, ErrorMessages::MISSING_CLIENT_ID), false);
                return;
            }
            net::post(workers_, [self = shared_from_this(), id = *client_id]() {
                auto registered = self->service_.IsRegistered(id);
                net::post(self->stream_.get_executor(), [self, id, registered = std::move(registered)]() {
                    if (registered.IsErr()) {
                        spdlog::error("Upgrade for {} failed: {}", id, registered.UnwrapErr().message);
                        self->Write(Rejection(http::status::internal_server_error, ErrorMessages::INTERNAL_ERROR), false);
                    } else if (!registered.Unwrap()) {
                        self->Write(Rejection(http::status::unauthorized, ErrorMessages::CLIENT_NOT_REGISTERED), false);
                    } else {
                        auto channel = std::make_shared<WebSocketChannel>(
                            self->stream_.release_socket(), id, self->service_, self->workers_,
                            self->push_timeout_);
                        channel->Accept(std::move(self->request_));
                    }
                });
            });
        }

        static HttpResponse Rejection(const http::status status, std::string_view error) {
            proto::wire::ErrorResponse body;
            body.set_error(std::string(error));
            auto printed = JsonCodec::Print(body, JsonCodec::Style::OmitDefaults);
            return HttpResponse{static_cast<unsigned>(status), "application/json",
                                printed.IsOk() ? std::move(printed).Unwrap() : std::string()};
        }

        void Write(HttpResponse response, const bool keep_alive) {
            auto message = std::make_shared<http::response<http::string_body>>(
                static_cast<http::status>(response.status), request_.version());
            message->set(http::field::server, "courier-relay");
            message->set(http::field::content_type, response.content_type);
            message->keep_alive(keep_alive);
            message->body() = std::move(response.body);
            message->prepare_payload();
            http::async_write(stream_, *message,
                [self = shared_from_this(), message](const beast::error_code ec, std::size_t) {
                    self->OnWrite(ec, message->need_eof());
                });
        }

        void OnWrite(beast::error_code ec, const bool close) {
            if (ec) {
                spdlog::debug("HTTP write failed: {}", ec.message());
                return;
            }
            if (close) {
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                return;
            }
            DoRead();
        }

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        RequestRouter& router_;
        RelayService& service_;
        net::thread_pool& workers_;
        std::chrono::milliseconds push_timeout_;
    };
}

HttpServer::HttpServer(RelayService& service, const RelayConfig& config)
    : service_(service)
    , router_(service)
    , host_(config.host)
    , port_(config.port)
    , push_timeout_(config.push_timeout)
    , workers_(config.workers)
    , acceptor_(net::make_strand(io_)) {
}

HttpServer::~HttpServer() {
    Stop();
}

Result<Unit, RelayFailure> HttpServer::Start() {
    beast::error_code ec;
    const auto address = net::ip::make_address(host_, ec);
    if (ec) {
        return Result<Unit, RelayFailure>::Err(RelayFailure::Validation(
            compat::format("Invalid listen address '{}': {}", host_, ec.message())));
    }
    const tcp::endpoint endpoint(address, port_);

    const auto fail = [&](const char* step) {
        return Result<Unit, RelayFailure>::Err(RelayFailure::Transport(
            compat::format("Failed to {} {}:{}: {}", step, host_, port_, ec.message())));
    };
    if (acceptor_.open(endpoint.protocol(), ec); ec) {
        return fail("open");
    }
    if (acceptor_.set_option(net::socket_base::reuse_address(true), ec); ec) {
        return fail("configure");
    }
    if (acceptor_.bind(endpoint, ec); ec) {
        return fail("bind");
    }
    if (acceptor_.listen(net::socket_base::max_listen_connections, ec); ec) {
        return fail("listen on");
    }
    port_ = acceptor_.local_endpoint().port();

    running_ = true;
    DoAccept();
    io_thread_ = std::thread([this]() { io_.run(); });
    spdlog::info("Relay server listening on http://{}:{}", host_, port_);
    return Result<Unit, RelayFailure>::Ok(protocol::unit);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(net::make_strand(io_), [this](const beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (running_) {
                spdlog::warn("Accept failed: {}", ec.message());
            } else {
                return;
            }
        } else {
            std::make_shared<HttpSession>(std::move(socket), router_, service_, workers_, push_timeout_)->Start();
        }
        if (running_) {
            DoAccept();
        }
    });
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });
    workers_.join();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    spdlog::info("Relay server stopped");
}

}
