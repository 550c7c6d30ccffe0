#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "wire/relay.pb.h"

namespace courier::relay {

using protocol::RelayFailure;
using protocol::Result;
using protocol::Unit;

/**
 * Shape checks of relay request bodies. Failures are
 * RelayFailureType::Validation with a "field: rule" message.
 *
 * Keys and signatures are checked for presence only; the relay never
 * interprets key material.
 */
class RequestValidation {
public:
    [[nodiscard]] static Result<Unit, RelayFailure> ValidateRegister(const proto::wire::RegisterRequest& request);

    [[nodiscard]] static Result<Unit, RelayFailure> ValidateBundle(const proto::wire::Bundle& bundle);

    [[nodiscard]] static Result<Unit, RelayFailure> ValidateUpload(const proto::wire::PreKeyUpload& upload);

    [[nodiscard]] static Result<Unit, RelayFailure> ValidateMessage(const proto::wire::RelayMessage& message);

    [[nodiscard]] static Result<Unit, RelayFailure> ValidateMetrics(const proto::wire::HostMetrics& metrics);

private:
    RequestValidation() = delete;
};

}
