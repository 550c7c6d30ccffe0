#include "courier/configuration/relay_config.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace courier::protocol::configuration {

namespace {
    std::optional<std::string> ReadVariable(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    template<typename T>
    Result<T, RelayFailure> ParseNumber(const char* name, const std::string& text, const T min, const T max) {
        T value{};
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || end != text.data() + text.size() || value < min || value > max) {
            return Result<T, RelayFailure>::Err(RelayFailure::Validation(
                compat::format("{}='{}' must be a number in [{}, {}]", name, text, min, max)));
        }
        return Result<T, RelayFailure>::Ok(value);
    }
}

RelayConfig::RelayConfig()
    : db_path((std::filesystem::current_path() / RelayConstants::DEFAULT_DB_PATH).string())
    , host(RelayConstants::DEFAULT_HOST)
    , port(RelayConstants::DEFAULT_PORT)
    , workers(RelayConstants::DEFAULT_WORKERS)
    , push_timeout(RelayConstants::DEFAULT_PUSH_TIMEOUT_MS)
    , log_level("info") {
}

RelayConfig RelayConfig::Default() {
    return RelayConfig();
}

RelayConfig RelayConfig::ForDatabase(std::string db_path) {
    RelayConfig config;
    config.db_path = std::move(db_path);
    return config;
}

Result<RelayConfig, RelayFailure> RelayConfig::FromEnvironment() {
    RelayConfig config;
    if (auto db = ReadVariable("RELAY_DB")) {
        config.db_path = *db;
    }
    auto port = ReadVariable("RELAY_PORT");
    if (!port) {
        port = ReadVariable("PORT");
    }
    if (port) {
        auto parsed = ParseNumber<uint16_t>("RELAY_PORT", *port, 0, 65535);
        if (parsed.IsErr()) {
            return Result<RelayConfig, RelayFailure>::Err(parsed.UnwrapErr());
        }
        config.port = parsed.Unwrap();
    }
    if (auto host = ReadVariable("RELAY_HOST")) {
        config.host = *host;
    }
    if (auto workers = ReadVariable("RELAY_WORKERS")) {
        auto parsed = ParseNumber<size_t>("RELAY_WORKERS", *workers, 1, 256);
        if (parsed.IsErr()) {
            return Result<RelayConfig, RelayFailure>::Err(parsed.UnwrapErr());
        }
        config.workers = parsed.Unwrap();
    }
    if (auto timeout = ReadVariable("RELAY_PUSH_TIMEOUT_MS")) {
        auto parsed = ParseNumber<uint32_t>("RELAY_PUSH_TIMEOUT_MS", *timeout, 1, 600000);
        if (parsed.IsErr()) {
            return Result<RelayConfig, RelayFailure>::Err(parsed.UnwrapErr());
        }
        config.push_timeout = std::chrono::milliseconds(parsed.Unwrap());
    }
    if (auto level = ReadVariable("RELAY_LOG_LEVEL")) {
        config.log_level = *level;
    }
    return Result<RelayConfig, RelayFailure>::Ok(std::move(config));
}

}
