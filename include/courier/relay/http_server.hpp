#pragma once
#include "courier/configuration/relay_config.hpp"
#include "courier/relay/relay_service.hpp"
#include "courier/relay/request_router.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace courier::relay {

/**
 * @brief HTTP and WebSocket front end of a RelayService
 *
 * Socket I/O runs on one io_context thread. Requests and push-channel
 * handshakes are executed on a separate worker pool, so a worker that
 * waits for a push to complete never blocks socket I/O. Such a wait is
 * bounded by RelayConfig::push_timeout.
 *
 * `GET /ws?client_id=<id>` upgrades to a push channel: 400 without a
 * client id, 401 for an unregistered id, 404 for any other upgrade path.
 */
class HttpServer {
public:
    HttpServer(RelayService& service, const protocol::configuration::RelayConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Binds, listens and starts the I/O thread. Port 0 binds an ephemeral port.
    Result<Unit, RelayFailure> Start();

    /// Bound port once started
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

    /// Stops accepting, drains the worker pool and stops the I/O thread. Idempotent.
    void Stop();

private:
    void DoAccept();

    RelayService& service_;
    RequestRouter router_;
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds push_timeout_;
    boost::asio::io_context io_;
    boost::asio::thread_pool workers_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
};

}
