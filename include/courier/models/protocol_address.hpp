#pragma once
#include <cstdint>
#include <string>
namespace courier::protocol::models {
class ProtocolAddress {
public:
    ProtocolAddress(std::string name, uint32_t device_id);

    [[nodiscard]] const std::string& GetName() const noexcept {
        return name_;
    }
    [[nodiscard]] uint32_t GetDeviceId() const noexcept {
        return device_id_;
    }

    /// "<name>.<deviceId>", the suffix of session and identity record keys.
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool operator==(const ProtocolAddress& other) const noexcept {
        return device_id_ == other.device_id_ && name_ == other.name_;
    }
private:
    std::string name_;
    uint32_t device_id_;
};
}
