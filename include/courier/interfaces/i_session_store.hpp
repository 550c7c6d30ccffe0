#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/models/protocol_address.hpp"
#include "protocol/key_material.pb.h"
#include <optional>
namespace courier::protocol::interfaces {
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    [[nodiscard]] virtual Result<std::optional<proto::protocol::SessionRecord>, ProtocolFailure> LoadSession(
        const models::ProtocolAddress& address) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> StoreSession(
        const models::ProtocolAddress& address,
        const proto::protocol::SessionRecord& record) = 0;
};
}
