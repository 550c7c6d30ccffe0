#pragma once

#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace courier::protocol::configuration {

/// Settings of one relay process
class RelayConfig {
public:
    /**
     * @brief Read the relay settings from the environment
     *
     * RELAY_DB, RELAY_PORT (falling back to PORT), RELAY_HOST, RELAY_WORKERS,
     * RELAY_PUSH_TIMEOUT_MS and RELAY_LOG_LEVEL. Unset variables keep their
     * defaults.
     *
     * @return Err(Validation) for a non-numeric or out-of-range port, worker
     *         count or push timeout
     */
    [[nodiscard]] static Result<RelayConfig, RelayFailure> FromEnvironment();

    [[nodiscard]] static RelayConfig Default();

    /// Default configuration backed by the database at `db_path`
    [[nodiscard]] static RelayConfig ForDatabase(std::string db_path);

    std::string db_path;
    std::string host;
    uint16_t port;
    size_t workers;
    /// Longest a single push frame may take to write before the channel is dropped
    std::chrono::milliseconds push_timeout;
    std::string log_level;

private:
    RelayConfig();
};

}
