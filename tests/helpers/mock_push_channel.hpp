#pragma once
#include "courier/relay/i_push_channel.hpp"
#include "courier/utilities/json_codec.hpp"
#include "wire/relay.pb.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::relay::test_helpers {

/// In-process push channel that records frames and close calls.
class MockPushChannel : public IPushChannel {
public:
    [[nodiscard]] Result<Unit, RelayFailure> Send(const std::string& text) override {
        std::lock_guard lock(mutex_);
        if (closed_code_.has_value()) {
            return Result<Unit, RelayFailure>::Err(RelayFailure::Transport("channel closed"));
        }
        if (fail_sends_) {
            return Result<Unit, RelayFailure>::Err(RelayFailure::Transport("simulated send failure"));
        }
        frames_.push_back(text);
        if (fail_after_.has_value() && frames_.size() >= *fail_after_) {
            fail_sends_ = true;
        }
        return Result<Unit, RelayFailure>::Ok(protocol::unit);
    }

    void Close(const uint16_t code, std::string_view reason) override {
        std::lock_guard lock(mutex_);
        if (closed_code_.has_value()) {
            return;
        }
        closed_code_ = code;
        close_reason_ = std::string(reason);
    }

    [[nodiscard]] bool IsOpen() const override {
        std::lock_guard lock(mutex_);
        return !closed_code_.has_value();
    }

    void FailSends(const bool fail) {
        std::lock_guard lock(mutex_);
        fail_sends_ = fail;
    }

    /// Sends start failing once `count` frames have been accepted.
    void FailAfter(const size_t count) {
        std::lock_guard lock(mutex_);
        fail_after_ = count;
    }

    [[nodiscard]] std::vector<std::string> Frames() const {
        std::lock_guard lock(mutex_);
        return frames_;
    }

    [[nodiscard]] std::vector<proto::wire::RelayMessage> Messages() const {
        std::vector<proto::wire::RelayMessage> messages;
        for (const auto& frame : Frames()) {
            auto parsed = protocol::utilities::JsonCodec::ParseAs<proto::wire::RelayMessage>(frame);
            if (parsed.IsOk()) {
                messages.push_back(std::move(parsed).Unwrap());
            }
        }
        return messages;
    }

    [[nodiscard]] std::optional<uint16_t> ClosedCode() const {
        std::lock_guard lock(mutex_);
        return closed_code_;
    }

    [[nodiscard]] std::string CloseReason() const {
        std::lock_guard lock(mutex_);
        return close_reason_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> frames_;
    std::optional<uint16_t> closed_code_;
    std::string close_reason_;
    bool fail_sends_ = false;
    std::optional<size_t> fail_after_;
};

}
