#include "courier/relay/relay_client.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/json_codec.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>

namespace courier::relay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using protocol::ErrorMessages;
using protocol::utilities::JsonCodec;

namespace {
    constexpr std::string_view kScheme = "http://";
    constexpr uint16_t kDefaultPort = 80;
    constexpr int kHttpVersion = 11;
    constexpr const char* kUserAgent = "courier-cli";

    RelayFailure FromResponse(const unsigned status, const std::string& body) {
        std::string message = body;
        proto::wire::ErrorResponse error;
        if (JsonCodec::Parse(body, error).IsOk() && !error.error().empty()) {
            message = error.error();
            if (!error.details().empty()) {
                message += " " + error.details();
            }
        }
        switch (status) {
            case 400:
                return RelayFailure::Validation(message);
            case 401:
                return RelayFailure::Unauthorized(message);
            case 404:
                if (error.error() == ErrorMessages::USER_NOT_REGISTERED ||
                    error.error() == ErrorMessages::RECIPIENT_NOT_REGISTERED) {
                    return RelayFailure::NotRegistered(message);
                }
                return RelayFailure::NotFound(message);
            default:
                return RelayFailure::Transport(compat::format("Relay answered {}: {}", status, message));
        }
    }

    std::string PercentEncode(std::string_view text) {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string encoded;
        for (const char c : text) {
            const auto byte = static_cast<unsigned char>(c);
            if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~') {
                encoded.push_back(c);
            } else {
                encoded.push_back('%');
                encoded.push_back(kHex[byte >> 4]);
                encoded.push_back(kHex[byte & 0x0F]);
            }
        }
        return encoded;
    }
}

RelayClient::RelayClient(std::string host, const uint16_t port)
    : host_(std::move(host))
    , port_(port) {
}

Result<RelayClient, RelayFailure> RelayClient::ForUrl(std::string_view base_url) {
    using ClientResult = Result<RelayClient, RelayFailure>;
    if (base_url.substr(0, kScheme.size()) != kScheme) {
        return ClientResult::Err(RelayFailure::Validation(
            compat::format("Relay URL must start with {}: '{}'", kScheme, base_url)));
    }
    std::string_view authority = base_url.substr(kScheme.size());
    while (!authority.empty() && authority.back() == '/') {
        authority.remove_suffix(1);
    }
    if (authority.empty() || authority.find('/') != std::string_view::npos) {
        return ClientResult::Err(RelayFailure::Validation(
            compat::format("Relay URL has no usable host: '{}'", base_url)));
    }
    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        return ClientResult::Ok(RelayClient(std::string(authority), kDefaultPort));
    }
    const std::string_view port_text = authority.substr(colon + 1);
    uint16_t port = 0;
    const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || end != port_text.data() + port_text.size() || port == 0 || colon == 0) {
        return ClientResult::Err(RelayFailure::Validation(
            compat::format("Relay URL has an invalid port: '{}'", base_url)));
    }
    return ClientResult::Ok(RelayClient(std::string(authority.substr(0, colon)), port));
}

Result<std::string, RelayFailure> RelayClient::Exchange(
    const http::verb method,
    const std::string& target,
    std::string body) const {
    using BodyResult = Result<std::string, RelayFailure>;
    try {
        net::io_context io;
        tcp::resolver resolver(io);
        beast::tcp_stream stream(io);
        stream.connect(resolver.resolve(host_, std::to_string(port_)));

        http::request<http::string_body> request{method, target, kHttpVersion};
        request.set(http::field::host, host_);
        request.set(http::field::user_agent, kUserAgent);
        if (!body.empty()) {
            request.set(http::field::content_type, "application/json");
            request.body() = std::move(body);
        }
        request.prepare_payload();
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(stream, buffer, response);

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const unsigned status = response.result_int();
        if (status < 200 || status >= 300) {
            return BodyResult::Err(FromResponse(status, response.body()));
        }
        return BodyResult::Ok(std::move(response.body()));
    } catch (const boost::system::system_error& ex) {
        return BodyResult::Err(RelayFailure::Transport(
            compat::format("Relay at {}:{} unreachable: {}", host_, port_, ex.code().message())));
    }
}

template<typename M>
Result<M, RelayFailure> RelayClient::ExchangeAs(
    const http::verb method,
    const std::string& target,
    const google::protobuf::Message* body) const {
    std::string text;
    if (body != nullptr) {
        auto printed = JsonCodec::Print(*body);
        if (printed.IsErr()) {
            return Result<M, RelayFailure>::Err(RelayFailure::Validation(printed.UnwrapErr().message));
        }
        text = std::move(printed).Unwrap();
    }
    auto answered = Exchange(method, target, std::move(text));
    if (answered.IsErr()) {
        return Result<M, RelayFailure>::Err(answered.UnwrapErr());
    }
    auto parsed = JsonCodec::ParseAs<M>(answered.Unwrap());
    if (parsed.IsErr()) {
        return Result<M, RelayFailure>::Err(RelayFailure::Transport(
            compat::format("Malformed relay response to {}: {}", target, parsed.UnwrapErr().message)));
    }
    return Result<M, RelayFailure>::Ok(std::move(parsed).Unwrap());
}

Result<proto::wire::RegisterResponse, RelayFailure> RelayClient::Register(const std::string& id) const {
    proto::wire::RegisterRequest request;
    request.set_id(id);
    return ExchangeAs<proto::wire::RegisterResponse>(http::verb::post, "/v1/register", &request);
}

Result<Unit, RelayFailure> RelayClient::UploadBundle(const std::string& id, const proto::wire::Bundle& bundle) const {
    proto::wire::PreKeyUpload upload;
    upload.set_id(id);
    *upload.mutable_bundle() = bundle;
    auto answered = ExchangeAs<proto::wire::OkResponse>(http::verb::post, "/v1/prekeys", &upload);
    if (answered.IsErr()) {
        return Result<Unit, RelayFailure>::Err(answered.UnwrapErr());
    }
    return Result<Unit, RelayFailure>::Ok(protocol::unit);
}

Result<proto::wire::Bundle, RelayFailure> RelayClient::FetchBundle(const std::string& id) const {
    auto fetched = ExchangeAs<proto::wire::PreKeyFetchResponse>(
        http::verb::get, "/v1/prekeys/" + PercentEncode(id), nullptr);
    if (fetched.IsErr()) {
        return Result<proto::wire::Bundle, RelayFailure>::Err(fetched.UnwrapErr());
    }
    return Result<proto::wire::Bundle, RelayFailure>::Ok(fetched.Unwrap().bundle());
}

Result<proto::wire::SubmitResponse, RelayFailure> RelayClient::Send(const proto::wire::RelayMessage& message) const {
    return ExchangeAs<proto::wire::SubmitResponse>(http::verb::post, "/v1/messages", &message);
}

Result<proto::wire::DiagnosticsSnapshot, RelayFailure> RelayClient::Diagnostics() const {
    return ExchangeAs<proto::wire::DiagnosticsSnapshot>(http::verb::get, "/diagnostics", nullptr);
}

Result<Unit, RelayFailure> RelayClient::Listen(const std::string& id, const FrameHandler& on_frame) const {
    using ListenResult = Result<Unit, RelayFailure>;
    try {
        net::io_context io;
        tcp::resolver resolver(io);
        websocket::stream<beast::tcp_stream> ws(io);
        beast::get_lowest_layer(ws).connect(resolver.resolve(host_, std::to_string(port_)));

        websocket::response_type handshake;
        beast::error_code ec;
        ws.handshake(handshake, compat::format("{}:{}", host_, port_), "/ws?client_id=" + PercentEncode(id), ec);
        if (ec == websocket::error::upgrade_declined) {
            return ListenResult::Err(FromResponse(handshake.result_int(), handshake.body()));
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        spdlog::debug("Listening on the relay as {}", id);

        beast::flat_buffer buffer;
        for (;;) {
            ws.read(buffer, ec);
            if (ec == websocket::error::closed) {
                const auto& reason = ws.reason();
                return ListenResult::Err(RelayFailure::Transport(compat::format(
                    "Relay closed the channel ({} {})",
                    static_cast<unsigned>(reason.code),
                    std::string(reason.reason.data(), reason.reason.size()))));
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            const std::string text = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());

            auto frame = JsonCodec::ParseAs<proto::wire::RelayMessage>(text);
            if (frame.IsErr()) {
                spdlog::warn("Ignoring malformed push frame: {}", frame.UnwrapErr().message);
                continue;
            }
            if (!on_frame(frame.Unwrap())) {
                ws.close(websocket::close_code::normal, ec);
                return ListenResult::Ok(protocol::unit);
            }
        }
    } catch (const boost::system::system_error& ex) {
        return ListenResult::Err(RelayFailure::Transport(
            compat::format("Push channel to {}:{} failed: {}", host_, port_, ex.code().message())));
    }
}

}
