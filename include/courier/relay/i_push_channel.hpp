#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace courier::relay {

using protocol::RelayFailure;
using protocol::Result;
using protocol::Unit;

/**
 * Server side of one push connection.
 *
 * Send returns once the frame has been written to the transport, so a
 * successful return counts as delivered. Close is idempotent.
 */
class IPushChannel {
public:
    virtual ~IPushChannel() = default;

    [[nodiscard]] virtual Result<Unit, RelayFailure> Send(const std::string& text) = 0;

    virtual void Close(uint16_t code, std::string_view reason) = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
};

}
