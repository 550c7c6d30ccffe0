#pragma once
#include "courier/relay/relay_service.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace courier::relay {

struct HttpRequest {
    std::string method;
    /// Path plus optional query, as sent on the request line
    std::string target;
    std::string body;
};

struct HttpResponse {
    unsigned status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/**
 * @brief Maps relay HTTP requests onto RelayService
 *
 * Error bodies are {"error": "..."}; schema failures add "details".
 * Never throws.
 */
class RequestRouter {
public:
    explicit RequestRouter(RelayService& service) : service_(service) {}

    [[nodiscard]] HttpResponse Handle(const HttpRequest& request);

    /// Decodes "%XX" escapes; malformed escapes are kept verbatim.
    [[nodiscard]] static std::string PercentDecode(std::string_view text);

    [[nodiscard]] static std::string_view PathOf(std::string_view target);

    /// Query values also read "+" as a space.
    [[nodiscard]] static std::optional<std::string> QueryParameter(std::string_view target, std::string_view name);

private:
    HttpResponse HandleRegister(const std::string& body);
    HttpResponse HandlePublish(const std::string& body);
    HttpResponse HandleFetch(std::string_view encoded_id);
    HttpResponse HandleSubmit(const std::string& body);
    HttpResponse HandleDiagnostics();
    HttpResponse HandleMetrics(const std::string& body);

    RelayService& service_;
};

}
