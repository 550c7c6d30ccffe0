#include "courier/configuration/relay_config.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/relay/http_server.hpp"
#include "courier/relay/relay_service.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>

using courier::protocol::configuration::RelayConfig;
using courier::protocol::crypto::SodiumInterop;
using courier::relay::HttpServer;
using courier::relay::RelayService;

int main() {
    auto config = RelayConfig::FromEnvironment();
    if (config.IsErr()) {
        spdlog::critical("Invalid relay configuration: {}", config.UnwrapErr().message);
        return EXIT_FAILURE;
    }
    const RelayConfig& settings = config.Unwrap();
    spdlog::set_level(spdlog::level::from_str(settings.log_level));

    if (auto initialized = SodiumInterop::Initialize(); initialized.IsErr()) {
        spdlog::critical("Failed to initialize libsodium: {}", initialized.UnwrapErr().message);
        return EXIT_FAILURE;
    }

    auto opened = RelayService::Open(settings);
    if (opened.IsErr()) {
        spdlog::critical("Failed to open relay database: {}", opened.UnwrapErr().message);
        return EXIT_FAILURE;
    }
    auto service = std::move(opened).Unwrap();

    HttpServer server(*service, settings);
    if (auto started = server.Start(); started.IsErr()) {
        spdlog::critical("Failed to start relay: {}", started.UnwrapErr().message);
        return EXIT_FAILURE;
    }
    spdlog::info("SQLite DB at {}", service->DatabasePath());

    boost::asio::io_context signals_io;
    boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, const int signal_number) {
        spdlog::info("Received signal {}, shutting down", signal_number);
    });
    signals_io.run();

    service->Shutdown();
    server.Stop();
    return EXIT_SUCCESS;
}
