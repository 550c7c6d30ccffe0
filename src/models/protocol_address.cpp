#include "courier/models/protocol_address.hpp"
#include "courier/core/format.hpp"
namespace courier::protocol::models {
ProtocolAddress::ProtocolAddress(std::string name, const uint32_t device_id)
    : name_(std::move(name))
    , device_id_(device_id) {
}

std::string ProtocolAddress::ToString() const {
    return compat::format("{}.{}", name_, device_id_);
}
}
