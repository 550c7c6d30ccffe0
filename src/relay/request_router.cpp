#include "courier/relay/request_router.hpp"
#include "courier/core/constants.hpp"
#include "courier/utilities/json_codec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace courier::relay {

using protocol::ErrorMessages;
using protocol::RelayConstants;
using protocol::RelayFailureType;
using protocol::utilities::JsonCodec;

namespace {
    constexpr std::string_view kPreKeysPrefix = "/v1/prekeys/";

    HttpResponse Json(const unsigned status, const google::protobuf::Message& message,
                      const JsonCodec::Style style = JsonCodec::Style::Full) {
        auto printed = JsonCodec::Print(message, style);
        if (printed.IsErr()) {
            spdlog::error("Failed to encode response: {}", printed.UnwrapErr().message);
            return HttpResponse{500, "application/json", R"({"error":"Internal server error."})"};
        }
        return HttpResponse{status, "application/json", std::move(printed).Unwrap()};
    }

    HttpResponse Error(const unsigned status, std::string_view error, std::string_view details = {}) {
        proto::wire::ErrorResponse body;
        body.set_error(std::string(error));
        body.set_details(std::string(details));
        return Json(status, body, JsonCodec::Style::OmitDefaults);
    }

    HttpResponse FromFailure(const protocol::RelayFailure& failure) {
        switch (failure.type) {
            case RelayFailureType::Validation:
                return Error(failure.HttpStatus(), ErrorMessages::INVALID_REQUEST, failure.message);
            case RelayFailureType::NotRegistered:
            case RelayFailureType::NotFound:
            case RelayFailureType::Unauthorized:
                return Error(failure.HttpStatus(), failure.message);
            case RelayFailureType::Transport:
            case RelayFailureType::Storage:
                break;
        }
        spdlog::error("Request failed: {}", failure.message);
        return Error(500, ErrorMessages::INTERNAL_ERROR);
    }

    HttpResponse OkBody() {
        proto::wire::OkResponse ok;
        ok.set_ok(true);
        return Json(200, ok);
    }

    /**
     * Parses a request body into `message`. An empty body reads as {}.
     *
     * @return The error response, or nullopt on success
     */
    std::optional<HttpResponse> ReadBody(const std::string& body, google::protobuf::Message& message) {
        const std::string_view json = body.empty() ? std::string_view("{}") : std::string_view(body);
        if (!JsonCodec::IsJsonObject(json)) {
            return Error(400, ErrorMessages::INVALID_JSON_BODY);
        }
        if (auto parsed = JsonCodec::Parse(json, message); parsed.IsErr()) {
            return Error(400, ErrorMessages::INVALID_REQUEST, parsed.UnwrapErr().message);
        }
        return std::nullopt;
    }

    int HexValue(const char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }
}

std::string RequestRouter::PercentDecode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = HexValue(text[i + 1]);
            const int low = HexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::string_view RequestRouter::PathOf(std::string_view target) {
    return target.substr(0, target.find('?'));
}

std::optional<std::string> RequestRouter::QueryParameter(std::string_view target, std::string_view name) {
    const auto question = target.find('?');
    if (question == std::string_view::npos) {
        return std::nullopt;
    }
    std::string query_text(target.substr(question + 1));
    std::replace(query_text.begin(), query_text.end(), '+', ' ');
    std::string_view query = query_text;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        const auto eq = pair.find('=');
        if (PercentDecode(pair.substr(0, eq)) == name) {
            return eq == std::string_view::npos ? std::string() : PercentDecode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

HttpResponse RequestRouter::Handle(const HttpRequest& request) {
    const std::string_view path = PathOf(request.target);
    const std::string& method = request.method;

    if (method == "GET" && path == "/health") {
        return HttpResponse{200, "text/plain; charset=utf-8", std::string(RelayConstants::HEALTH_BODY)};
    }
    if (method == "GET" && path == "/diagnostics") {
        return HandleDiagnostics();
    }
    if (method == "POST" && path == "/diagnostics/metrics") {
        return HandleMetrics(request.body);
    }
    if (method == "POST" && path == "/v1/register") {
        return HandleRegister(request.body);
    }
    if (method == "POST" && path == "/v1/prekeys") {
        return HandlePublish(request.body);
    }
    if (method == "GET" && path.size() > kPreKeysPrefix.size() && path.substr(0, kPreKeysPrefix.size()) == kPreKeysPrefix) {
        return HandleFetch(path.substr(kPreKeysPrefix.size()));
    }
    if (method == "POST" && path == "/v1/messages") {
        return HandleSubmit(request.body);
    }
    return Error(404, ErrorMessages::NOT_FOUND);
}

HttpResponse RequestRouter::HandleRegister(const std::string& body) {
    proto::wire::RegisterRequest request;
    if (auto error = ReadBody(body, request)) {
        return *error;
    }
    auto registered = service_.Register(request);
    if (registered.IsErr()) {
        return FromFailure(registered.UnwrapErr());
    }
    return Json(200, registered.Unwrap());
}

HttpResponse RequestRouter::HandlePublish(const std::string& body) {
    proto::wire::PreKeyUpload upload;
    if (auto error = ReadBody(body, upload)) {
        return *error;
    }
    if (auto published = service_.PublishBundle(upload); published.IsErr()) {
        return FromFailure(published.UnwrapErr());
    }
    return OkBody();
}

HttpResponse RequestRouter::HandleFetch(std::string_view encoded_id) {
    auto fetched = service_.FetchBundle(PercentDecode(encoded_id));
    if (fetched.IsErr()) {
        return FromFailure(fetched.UnwrapErr());
    }
    return Json(200, fetched.Unwrap());
}

HttpResponse RequestRouter::HandleSubmit(const std::string& body) {
    proto::wire::RelayMessage message;
    if (auto error = ReadBody(body, message)) {
        return *error;
    }
    auto submitted = service_.Submit(message);
    if (submitted.IsErr()) {
        return FromFailure(submitted.UnwrapErr());
    }
    return Json(200, submitted.Unwrap());
}

HttpResponse RequestRouter::HandleDiagnostics() {
    auto snapshot = service_.Diagnostics();
    if (snapshot.IsErr()) {
        return FromFailure(snapshot.UnwrapErr());
    }
    return Json(200, snapshot.Unwrap());
}

HttpResponse RequestRouter::HandleMetrics(const std::string& body) {
    proto::wire::HostMetrics metrics;
    if (auto error = ReadBody(body, metrics)) {
        return *error;
    }
    if (auto pushed = service_.PushMetrics(metrics); pushed.IsErr()) {
        return FromFailure(pushed.UnwrapErr());
    }
    return OkBody();
}

}
