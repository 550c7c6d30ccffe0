#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "wire/relay.pb.h"
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace courier::relay {

using protocol::RelayFailure;
using protocol::Result;
using protocol::Unit;

/**
 * @brief Blocking client of the relay HTTP and WebSocket surface
 *
 * Each call opens its own connection. Error responses map back onto
 * RelayFailure by status: 400 Validation, 401 Unauthorized, 404
 * NotRegistered or NotFound by message, anything else Transport.
 */
class RelayClient {
public:
    /// Called for each pushed frame; returning false ends Listen.
    using FrameHandler = std::function<bool(const proto::wire::RelayMessage&)>;

    /// Accepts "http://host[:port]" with an optional trailing slash.
    static Result<RelayClient, RelayFailure> ForUrl(std::string_view base_url);

    Result<proto::wire::RegisterResponse, RelayFailure> Register(const std::string& id) const;

    Result<Unit, RelayFailure> UploadBundle(const std::string& id, const proto::wire::Bundle& bundle) const;

    Result<proto::wire::Bundle, RelayFailure> FetchBundle(const std::string& id) const;

    Result<proto::wire::SubmitResponse, RelayFailure> Send(const proto::wire::RelayMessage& message) const;

    Result<proto::wire::DiagnosticsSnapshot, RelayFailure> Diagnostics() const;

    /**
     * @brief Open the push channel of `id` and feed frames to `on_frame`
     *
     * Blocks until the handler returns false or the relay closes the
     * channel. A close by the relay, supersession included, is reported
     * as Err(Transport) carrying the close code and reason.
     */
    Result<Unit, RelayFailure> Listen(const std::string& id, const FrameHandler& on_frame) const;

    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

private:
    RelayClient(std::string host, uint16_t port);

    Result<std::string, RelayFailure> Exchange(
        boost::beast::http::verb method,
        const std::string& target,
        std::string body) const;

    template<typename M>
    Result<M, RelayFailure> ExchangeAs(
        boost::beast::http::verb method,
        const std::string& target,
        const google::protobuf::Message* body) const;

    std::string host_;
    uint16_t port_;
};

}
