#pragma once
#include "courier/relay/i_push_channel.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace courier::relay {

/**
 * @brief Live push connections, at most one per identity id
 *
 * Slots live in an arena indexed through the id map; a freed slot is
 * reused by the next install. Supersession (look up, close the old
 * channel, replace the slot) happens under one lock.
 */
class ConnectionRegistry {
public:
    /**
     * @brief Make `channel` the connection of `id`
     *
     * A previous channel of `id` is closed with 4000 "superseded" first.
     *
     * @return The superseded channel, or nullptr
     */
    std::shared_ptr<IPushChannel> Install(const std::string& id, std::shared_ptr<IPushChannel> channel);

    /**
     * @brief Drop the connection of `id` if it is still `channel`
     *
     * @return false when `id` has no connection or a newer one
     */
    bool Remove(const std::string& id, const IPushChannel* channel);

    [[nodiscard]] std::shared_ptr<IPushChannel> Find(const std::string& id) const;

    [[nodiscard]] size_t Size() const;

    /// Closes every connection and empties the registry.
    void CloseAll(uint16_t code, std::string_view reason);

private:
    struct Slot {
        std::string id;
        std::shared_ptr<IPushChannel> channel;
    };

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<size_t> free_slots_;
    std::unordered_map<std::string, size_t> index_;
};

}
