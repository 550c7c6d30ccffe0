#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "app/messages.pb.h"
#include <string>
#include <string_view>
#include <variant>

namespace courier::protocol::models {

/**
 * Application payload carried inside a decrypted envelope, discriminated
 * by its `kind` field.
 */
using ApplicationMessage = std::variant<
    proto::app::ChatPrompt,
    proto::app::ChatReply,
    proto::app::TelemetryReport,
    proto::app::ControlPing>;

struct MessageKinds {
    static constexpr std::string_view CHAT_PROMPT = "chat.prompt";
    static constexpr std::string_view CHAT_REPLY = "chat.reply";
    static constexpr std::string_view TELEMETRY_REPORT = "telemetry.report";
    static constexpr std::string_view CONTROL_PING = "control.ping";
};

class ApplicationMessageCodec {
public:
    /**
     * @brief Parse and validate a JSON application message
     *
     * Every kind requires version 1 and a positive createdAt. String fields
     * must be non-empty, host metrics non-negative and `load` exactly three
     * numbers.
     *
     * @return Err(InvalidInput) for an unknown kind or an invalid field,
     *         Err(Decode) for malformed JSON
     */
    [[nodiscard]] static Result<ApplicationMessage, ProtocolFailure> Decode(std::string_view json);

    /// Validates, then prints the JSON shape Decode accepts.
    [[nodiscard]] static Result<std::string, ProtocolFailure> Encode(const ApplicationMessage& message);

    [[nodiscard]] static std::string_view KindOf(const ApplicationMessage& message) noexcept;

    [[nodiscard]] static Result<Unit, ProtocolFailure> Validate(const ApplicationMessage& message);

    [[nodiscard]] static proto::app::ChatPrompt MakeChatPrompt(
        std::string request_id, std::string prompt, std::string from, int64_t created_at);

    [[nodiscard]] static proto::app::ChatReply MakeChatReply(
        std::string request_id, std::string reply, std::string from, int64_t created_at);

    [[nodiscard]] static proto::app::ControlPing MakeControlPing(int64_t created_at);

private:
    ApplicationMessageCodec() = delete;
};

}
