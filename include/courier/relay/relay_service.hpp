#pragma once
#include "courier/configuration/relay_config.hpp"
#include "courier/relay/connection_registry.hpp"
#include "courier/relay/i_push_channel.hpp"
#include "courier/relay/relay_database.hpp"
#include "wire/relay.pb.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace courier::relay {

/**
 * @brief Store-and-forward relay of opaque envelopes
 *
 * Owns the relay database and the push connections. Submission and
 * replay for one recipient serialize on that recipient's mutex, so
 * entries reach a connection in enqueue order and at most once per
 * successful push.
 *
 * Delivery failures leave entries queued; they are logged and never
 * reported to the submitter.
 */
class RelayService {
public:
    /// Opens (creating when absent) the database named by `config`.
    static Result<std::unique_ptr<RelayService>, RelayFailure> Open(
        const protocol::configuration::RelayConfig& config);

    ~RelayService();

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    /// Idempotent; a duplicate registration succeeds.
    Result<proto::wire::RegisterResponse, RelayFailure> Register(const proto::wire::RegisterRequest& request);

    Result<bool, RelayFailure> IsRegistered(std::string_view id);

    /// Last write wins. Err(NotRegistered) when `upload.id` is unknown.
    Result<Unit, RelayFailure> PublishBundle(const proto::wire::PreKeyUpload& upload);

    /// Err(NotFound) when no bundle was published for `id`.
    Result<proto::wire::PreKeyFetchResponse, RelayFailure> FetchBundle(std::string_view id);

    /**
     * @brief Queue an envelope and push it when the recipient is connected
     *
     * Err(NotRegistered) without creating a queue entry when `message.to`
     * is unknown. `delivered` reports whether the new entry itself was
     * pushed before returning.
     */
    Result<proto::wire::SubmitResponse, RelayFailure> Submit(const proto::wire::RelayMessage& message);

    /**
     * @brief Install `channel` as the connection of `id` and replay its queue
     *
     * Err(Unauthorized) when `id` is not registered. A previous connection
     * is closed with 4000 "superseded" before the new one is installed.
     * Blocks until the replay ends.
     */
    Result<Unit, RelayFailure> Connect(const std::string& id, std::shared_ptr<IPushChannel> channel);

    /// No-op unless `channel` is still the connection of `id`.
    void Disconnect(const std::string& id, const IPushChannel* channel);

    Result<proto::wire::DiagnosticsSnapshot, RelayFailure> Diagnostics();

    /// Replaces the latest host sample.
    Result<Unit, RelayFailure> PushMetrics(const proto::wire::HostMetrics& metrics);

    /// Closes every connection, then the database. Idempotent.
    void Shutdown();

    [[nodiscard]] const std::string& DatabasePath() const noexcept { return db_path_; }

    [[nodiscard]] size_t ActiveConnections() const { return connections_.Size(); }

private:
    RelayService(std::unique_ptr<RelayDatabase> db, std::string db_path);

    std::shared_ptr<std::mutex> RecipientMutex(const std::string& id);

    /**
     * @brief Push the undelivered entries of `id` in order
     *
     * Stops at the first failed push.
     *
     * @return Whether the entry `watched_id` was delivered
     */
    Result<bool, RelayFailure> Flush(
        const std::string& id,
        IPushChannel& channel,
        std::string_view watched_id);

    std::unique_ptr<RelayDatabase> db_;
    std::string db_path_;
    ConnectionRegistry connections_;
    std::chrono::steady_clock::time_point started_at_;

    std::mutex recipients_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> recipient_mutexes_;

    std::mutex metrics_mutex_;
    std::optional<proto::wire::HostMetrics> latest_metrics_;

    std::atomic<bool> shut_down_{false};
};

}
