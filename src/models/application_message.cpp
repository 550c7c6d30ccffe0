#include "courier/models/application_message.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/json_codec.hpp"

namespace courier::protocol::models {

using utilities::JsonCodec;

namespace {
    template<typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template<typename... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    Result<Unit, ProtocolFailure> Invalid(std::string_view field, std::string_view rule) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("{}: {}", field, rule)));
    }

    Result<Unit, ProtocolFailure> CheckHeader(
        const int32_t version,
        const std::string& kind,
        std::string_view expected_kind,
        const int64_t created_at) {
        if (version != static_cast<int32_t>(Constants::APPLICATION_MESSAGE_VERSION)) {
            return Invalid("version", "must be 1");
        }
        if (kind != expected_kind) {
            return Invalid("kind", compat::format("must be '{}'", expected_kind));
        }
        if (created_at <= 0) {
            return Invalid("createdAt", "must be a positive integer");
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> CheckText(std::string_view field, const std::string& value) {
        if (value.empty()) {
            return Invalid(field, "must not be empty");
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> CheckHost(const proto::app::HostSample& host) {
        if (host.cpu_pct() < 0 || host.mem_pct() < 0 || host.swap_pct() < 0 ||
            host.net_in_bytes() < 0 || host.net_out_bytes() < 0) {
            return Invalid("host", "metrics must be non-negative");
        }
        if (host.load_size() != 3) {
            return Invalid("host.load", "must hold exactly 3 numbers");
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> ValidatePrompt(const proto::app::ChatPrompt& message) {
        COURIER_TRY_UNIT(CheckHeader(message.version(), message.kind(), MessageKinds::CHAT_PROMPT,
                                     message.created_at()));
        COURIER_TRY_UNIT(CheckText("requestId", message.request_id()));
        COURIER_TRY_UNIT(CheckText("prompt", message.prompt()));
        return CheckText("from", message.from());
    }

    Result<Unit, ProtocolFailure> ValidateReply(const proto::app::ChatReply& message) {
        COURIER_TRY_UNIT(CheckHeader(message.version(), message.kind(), MessageKinds::CHAT_REPLY,
                                     message.created_at()));
        COURIER_TRY_UNIT(CheckText("requestId", message.request_id()));
        COURIER_TRY_UNIT(CheckText("reply", message.reply()));
        return CheckText("from", message.from());
    }

    Result<Unit, ProtocolFailure> ValidateReport(const proto::app::TelemetryReport& message) {
        COURIER_TRY_UNIT(CheckHeader(message.version(), message.kind(), MessageKinds::TELEMETRY_REPORT,
                                     message.created_at()));
        COURIER_TRY_UNIT(CheckText("reportId", message.report_id()));
        COURIER_TRY_UNIT(CheckText("source", message.source()));
        if (!message.has_relay() || !message.relay().has_counts()) {
            return Invalid("relay", "snapshot with counts is required");
        }
        if (!message.has_host()) {
            return Invalid("host", "is required");
        }
        return CheckHost(message.host());
    }

    Result<Unit, ProtocolFailure> ValidatePing(const proto::app::ControlPing& message) {
        return CheckHeader(message.version(), message.kind(), MessageKinds::CONTROL_PING, message.created_at());
    }

    template<typename M>
    Result<ApplicationMessage, ProtocolFailure> DecodeAs(std::string_view json) {
        auto parsed = JsonCodec::ParseAs<M>(json);
        if (parsed.IsErr()) {
            return Result<ApplicationMessage, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        ApplicationMessage message(std::move(parsed).Unwrap());
        if (auto valid = ApplicationMessageCodec::Validate(message); valid.IsErr()) {
            return Result<ApplicationMessage, ProtocolFailure>::Err(valid.UnwrapErr());
        }
        return Result<ApplicationMessage, ProtocolFailure>::Ok(std::move(message));
    }
}

std::string_view ApplicationMessageCodec::KindOf(const ApplicationMessage& message) noexcept {
    return std::visit(Overloaded{
        [](const proto::app::ChatPrompt&) { return MessageKinds::CHAT_PROMPT; },
        [](const proto::app::ChatReply&) { return MessageKinds::CHAT_REPLY; },
        [](const proto::app::TelemetryReport&) { return MessageKinds::TELEMETRY_REPORT; },
        [](const proto::app::ControlPing&) { return MessageKinds::CONTROL_PING; },
    }, message);
}

Result<Unit, ProtocolFailure> ApplicationMessageCodec::Validate(const ApplicationMessage& message) {
    return std::visit(Overloaded{
        [](const proto::app::ChatPrompt& m) { return ValidatePrompt(m); },
        [](const proto::app::ChatReply& m) { return ValidateReply(m); },
        [](const proto::app::TelemetryReport& m) { return ValidateReport(m); },
        [](const proto::app::ControlPing& m) { return ValidatePing(m); },
    }, message);
}

Result<ApplicationMessage, ProtocolFailure> ApplicationMessageCodec::Decode(std::string_view json) {
    auto header = JsonCodec::ParseAs<proto::app::KindHeader>(json);
    if (header.IsErr()) {
        return Result<ApplicationMessage, ProtocolFailure>::Err(header.UnwrapErr());
    }
    const auto& kind = header.Unwrap().kind();
    if (kind == MessageKinds::CHAT_PROMPT) {
        return DecodeAs<proto::app::ChatPrompt>(json);
    }
    if (kind == MessageKinds::CHAT_REPLY) {
        return DecodeAs<proto::app::ChatReply>(json);
    }
    if (kind == MessageKinds::TELEMETRY_REPORT) {
        return DecodeAs<proto::app::TelemetryReport>(json);
    }
    if (kind == MessageKinds::CONTROL_PING) {
        return DecodeAs<proto::app::ControlPing>(json);
    }
    return Result<ApplicationMessage, ProtocolFailure>::Err(
        ProtocolFailure::InvalidInput(compat::format("Unknown message kind '{}'", kind)));
}

Result<std::string, ProtocolFailure> ApplicationMessageCodec::Encode(const ApplicationMessage& message) {
    if (auto valid = Validate(message); valid.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(valid.UnwrapErr());
    }
    return std::visit([](const auto& m) { return JsonCodec::Print(m); }, message);
}

proto::app::ChatPrompt ApplicationMessageCodec::MakeChatPrompt(
    std::string request_id, std::string prompt, std::string from, const int64_t created_at) {
    proto::app::ChatPrompt message;
    message.set_version(static_cast<int32_t>(Constants::APPLICATION_MESSAGE_VERSION));
    message.set_kind(std::string(MessageKinds::CHAT_PROMPT));
    message.set_request_id(std::move(request_id));
    message.set_prompt(std::move(prompt));
    message.set_from(std::move(from));
    message.set_created_at(created_at);
    return message;
}

proto::app::ChatReply ApplicationMessageCodec::MakeChatReply(
    std::string request_id, std::string reply, std::string from, const int64_t created_at) {
    proto::app::ChatReply message;
    message.set_version(static_cast<int32_t>(Constants::APPLICATION_MESSAGE_VERSION));
    message.set_kind(std::string(MessageKinds::CHAT_REPLY));
    message.set_request_id(std::move(request_id));
    message.set_reply(std::move(reply));
    message.set_from(std::move(from));
    message.set_created_at(created_at);
    return message;
}

proto::app::ControlPing ApplicationMessageCodec::MakeControlPing(const int64_t created_at) {
    proto::app::ControlPing message;
    message.set_version(static_cast<int32_t>(Constants::APPLICATION_MESSAGE_VERSION));
    message.set_kind(std::string(MessageKinds::CONTROL_PING));
    message.set_created_at(created_at);
    return message;
}

}
