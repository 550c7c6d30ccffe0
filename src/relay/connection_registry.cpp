#include "courier/relay/connection_registry.hpp"
#include "courier/core/constants.hpp"
#include <spdlog/spdlog.h>

namespace courier::relay {

using protocol::RelayConstants;

std::shared_ptr<IPushChannel> ConnectionRegistry::Install(
    const std::string& id,
    std::shared_ptr<IPushChannel> channel) {
    std::lock_guard lock(mutex_);
    if (const auto it = index_.find(id); it != index_.end()) {
        Slot& slot = slots_[it->second];
        auto previous = std::move(slot.channel);
        const bool superseded = previous && previous != channel;
        if (superseded) {
            previous->Close(RelayConstants::CLOSE_CODE_SUPERSEDED, RelayConstants::CLOSE_REASON_SUPERSEDED);
            spdlog::info("Connection for {} superseded", id);
        }
        slot.channel = std::move(channel);
        return superseded ? previous : std::shared_ptr<IPushChannel>();
    }

    size_t position;
    if (!free_slots_.empty()) {
        position = free_slots_.back();
        free_slots_.pop_back();
        slots_[position] = Slot{id, std::move(channel)};
    } else {
        position = slots_.size();
        slots_.push_back(Slot{id, std::move(channel)});
    }
    index_.emplace(id, position);
    return nullptr;
}

bool ConnectionRegistry::Remove(const std::string& id, const IPushChannel* channel) {
    std::lock_guard lock(mutex_);
    const auto it = index_.find(id);
    if (it == index_.end() || slots_[it->second].channel.get() != channel) {
        return false;
    }
    slots_[it->second] = Slot{};
    free_slots_.push_back(it->second);
    index_.erase(it);
    return true;
}

std::shared_ptr<IPushChannel> ConnectionRegistry::Find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return slots_[it->second].channel;
}

size_t ConnectionRegistry::Size() const {
    std::lock_guard lock(mutex_);
    return index_.size();
}

void ConnectionRegistry::CloseAll(const uint16_t code, std::string_view reason) {
    std::vector<std::shared_ptr<IPushChannel>> open;
    {
        std::lock_guard lock(mutex_);
        for (auto& slot : slots_) {
            if (slot.channel) {
                open.push_back(std::move(slot.channel));
            }
        }
        slots_.clear();
        free_slots_.clear();
        index_.clear();
    }
    for (const auto& channel : open) {
        channel->Close(code, reason);
    }
}

}
