#include "courier/relay/relay_service.hpp"
#include "courier/relay/request_validation.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/encoding.hpp"
#include "courier/utilities/envelope_codec.hpp"
#include "courier/utilities/json_codec.hpp"
#include <spdlog/spdlog.h>

namespace courier::relay {

using protocol::ErrorMessages;
using protocol::RelayConstants;
using protocol::utilities::Encoding;
using protocol::utilities::EnvelopeCodec;
using protocol::utilities::JsonCodec;

namespace {
    RelayFailure StorageError(const StorageFailure& failure) {
        return RelayFailure::FromStorageFailure(failure);
    }

    Result<std::string, RelayFailure> BuildFrame(const QueueEntry& entry) {
        proto::wire::RelayMessage frame;
        frame.set_from(entry.from_id);
        frame.set_to(entry.to_id);
        if (auto parsed = JsonCodec::Parse(entry.envelope_json, *frame.mutable_envelope()); parsed.IsErr()) {
            return Result<std::string, RelayFailure>::Err(RelayFailure::Storage(
                compat::format("Queued message {} holds an unreadable envelope: {}",
                               entry.id, parsed.UnwrapErr().message)));
        }
        auto printed = JsonCodec::Print(frame);
        if (printed.IsErr()) {
            return Result<std::string, RelayFailure>::Err(RelayFailure::Storage(printed.UnwrapErr().message));
        }
        return Result<std::string, RelayFailure>::Ok(std::move(printed).Unwrap());
    }

    const char* DepthBucket(const uint32_t depth) {
        if (depth == 0) {
            return "0";
        }
        if (depth <= 5) {
            return "1-5";
        }
        if (depth <= 20) {
            return "6-20";
        }
        return "21+";
    }
}

RelayService::RelayService(std::unique_ptr<RelayDatabase> db, std::string db_path)
    : db_(std::move(db))
    , db_path_(std::move(db_path))
    , started_at_(std::chrono::steady_clock::now()) {
}

RelayService::~RelayService() {
    Shutdown();
}

Result<std::unique_ptr<RelayService>, RelayFailure> RelayService::Open(
    const protocol::configuration::RelayConfig& config) {
    using OpenResult = Result<std::unique_ptr<RelayService>, RelayFailure>;
    auto db = RelayDatabase::Open(config.db_path);
    if (db.IsErr()) {
        return OpenResult::Err(StorageError(db.UnwrapErr()));
    }
    return OpenResult::Ok(std::unique_ptr<RelayService>(
        new RelayService(std::move(db).Unwrap(), config.db_path)));
}

void RelayService::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    connections_.CloseAll(1001, "relay shutting down");
    db_->Close();
    spdlog::info("Relay stopped");
}

std::shared_ptr<std::mutex> RelayService::RecipientMutex(const std::string& id) {
    std::lock_guard lock(recipients_mutex_);
    auto& slot = recipient_mutexes_[id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

// ============================================================================
// Registration and bundles
// ============================================================================

Result<proto::wire::RegisterResponse, RelayFailure> RelayService::Register(
    const proto::wire::RegisterRequest& request) {
    using RegisterResult = Result<proto::wire::RegisterResponse, RelayFailure>;
    if (auto valid = RequestValidation::ValidateRegister(request); valid.IsErr()) {
        return std::move(valid).PropagateErr<proto::wire::RegisterResponse>();
    }
    if (auto inserted = db_->InsertUser(request.id(), Encoding::NowMillis()); inserted.IsErr()) {
        return RegisterResult::Err(StorageError(inserted.UnwrapErr()));
    }
    spdlog::info("Registered {}", request.id());
    proto::wire::RegisterResponse response;
    response.set_id(request.id());
    return RegisterResult::Ok(std::move(response));
}

Result<bool, RelayFailure> RelayService::IsRegistered(std::string_view id) {
    auto exists = db_->UserExists(id);
    if (exists.IsErr()) {
        return Result<bool, RelayFailure>::Err(StorageError(exists.UnwrapErr()));
    }
    return Result<bool, RelayFailure>::Ok(exists.Unwrap());
}

Result<Unit, RelayFailure> RelayService::PublishBundle(const proto::wire::PreKeyUpload& upload) {
    COURIER_TRY_UNIT(RequestValidation::ValidateUpload(upload));
    auto registered = IsRegistered(upload.id());
    if (registered.IsErr()) {
        return std::move(registered).PropagateErr<Unit>();
    }
    if (!registered.Unwrap()) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::NotRegistered(std::string(ErrorMessages::USER_NOT_REGISTERED)));
    }
    auto bundle_json = JsonCodec::Print(upload.bundle());
    if (bundle_json.IsErr()) {
        return Result<Unit, RelayFailure>::Err(RelayFailure::Validation(bundle_json.UnwrapErr().message));
    }
    if (auto stored = db_->UpsertBundle(upload.id(), bundle_json.Unwrap(), Encoding::NowMillis()); stored.IsErr()) {
        return Result<Unit, RelayFailure>::Err(StorageError(stored.UnwrapErr()));
    }
    spdlog::info("Published bundle for {}", upload.id());
    return Result<Unit, RelayFailure>::Ok(protocol::unit);
}

Result<proto::wire::PreKeyFetchResponse, RelayFailure> RelayService::FetchBundle(std::string_view id) {
    using FetchResult = Result<proto::wire::PreKeyFetchResponse, RelayFailure>;
    auto stored = db_->GetBundle(id);
    if (stored.IsErr()) {
        return FetchResult::Err(StorageError(stored.UnwrapErr()));
    }
    if (!stored.Unwrap().has_value()) {
        return FetchResult::Err(RelayFailure::NotFound(std::string(ErrorMessages::PREKEYS_NOT_FOUND)));
    }
    proto::wire::PreKeyFetchResponse response;
    response.set_id(std::string(id));
    if (auto parsed = JsonCodec::Parse(*stored.Unwrap(), *response.mutable_bundle()); parsed.IsErr()) {
        return FetchResult::Err(RelayFailure::Storage(
            compat::format("Stored bundle of {} is unreadable: {}", id, parsed.UnwrapErr().message)));
    }
    return FetchResult::Ok(std::move(response));
}

// ============================================================================
// Queue and delivery
// ============================================================================

Result<bool, RelayFailure> RelayService::Flush(
    const std::string& id,
    IPushChannel& channel,
    std::string_view watched_id) {
    auto pending = db_->PendingFor(id);
    if (pending.IsErr()) {
        return Result<bool, RelayFailure>::Err(StorageError(pending.UnwrapErr()));
    }
    bool watched_delivered = false;
    for (const auto& entry : pending.Unwrap()) {
        auto frame = BuildFrame(entry);
        if (frame.IsErr()) {
            spdlog::error("{}", frame.UnwrapErr().message);
            break;
        }
        if (auto sent = channel.Send(frame.Unwrap()); sent.IsErr()) {
            spdlog::warn("Delivery of {} to {} failed: {}", entry.id, id, sent.UnwrapErr().message);
            break;
        }
        if (auto marked = db_->MarkDelivered(entry.id); marked.IsErr()) {
            return Result<bool, RelayFailure>::Err(StorageError(marked.UnwrapErr()));
        }
        if (entry.id == watched_id) {
            watched_delivered = true;
        }
    }
    return Result<bool, RelayFailure>::Ok(watched_delivered);
}

Result<proto::wire::SubmitResponse, RelayFailure> RelayService::Submit(const proto::wire::RelayMessage& message) {
    using SubmitResult = Result<proto::wire::SubmitResponse, RelayFailure>;
    if (auto valid = RequestValidation::ValidateMessage(message); valid.IsErr()) {
        return SubmitResult::Err(valid.UnwrapErr());
    }
    auto registered = IsRegistered(message.to());
    if (registered.IsErr()) {
        return SubmitResult::Err(registered.UnwrapErr());
    }
    if (!registered.Unwrap()) {
        return SubmitResult::Err(RelayFailure::NotRegistered(std::string(ErrorMessages::RECIPIENT_NOT_REGISTERED)));
    }
    auto envelope_json = EnvelopeCodec::ToJson(message.envelope());
    if (envelope_json.IsErr()) {
        return SubmitResult::Err(RelayFailure::Validation(envelope_json.UnwrapErr().message));
    }

    QueueEntry entry;
    entry.id = Encoding::GenerateUuid();
    entry.to_id = message.to();
    entry.from_id = message.from();
    entry.envelope_json = std::move(envelope_json).Unwrap();

    const auto recipient_mutex = RecipientMutex(entry.to_id);
    std::lock_guard recipient_lock(*recipient_mutex);
    // Stamped under the lock so created_at order matches insertion order.
    entry.created_at = Encoding::NowMillis();
    if (auto inserted = db_->InsertMessage(entry); inserted.IsErr()) {
        return SubmitResult::Err(StorageError(inserted.UnwrapErr()));
    }

    bool delivered = false;
    if (const auto channel = connections_.Find(entry.to_id); channel && channel->IsOpen()) {
        auto flushed = Flush(entry.to_id, *channel, entry.id);
        if (flushed.IsErr()) {
            return SubmitResult::Err(flushed.UnwrapErr());
        }
        delivered = flushed.Unwrap();
    }
    spdlog::debug("Queued {} from {} to {} (delivered: {})", entry.id, entry.from_id, entry.to_id, delivered);

    proto::wire::SubmitResponse response;
    response.set_ok(true);
    response.set_queued(true);
    response.set_delivered(delivered);
    return SubmitResult::Ok(std::move(response));
}

Result<Unit, RelayFailure> RelayService::Connect(const std::string& id, std::shared_ptr<IPushChannel> channel) {
    auto registered = IsRegistered(id);
    if (registered.IsErr()) {
        return std::move(registered).PropagateErr<Unit>();
    }
    if (!registered.Unwrap()) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::Unauthorized(std::string(ErrorMessages::CLIENT_NOT_REGISTERED)));
    }

    const auto recipient_mutex = RecipientMutex(id);
    std::lock_guard recipient_lock(*recipient_mutex);
    IPushChannel& installed = *channel;
    connections_.Install(id, std::move(channel));
    if (!installed.IsOpen()) {
        // The peer went away before the install; its Disconnect found nothing to remove.
        connections_.Remove(id, &installed);
        spdlog::info("Client {} closed before it was connected", id);
        return Result<Unit, RelayFailure>::Ok(protocol::unit);
    }
    spdlog::info("Client {} connected", id);

    auto flushed = Flush(id, installed, {});
    if (flushed.IsErr()) {
        return Result<Unit, RelayFailure>::Err(flushed.UnwrapErr());
    }
    return Result<Unit, RelayFailure>::Ok(protocol::unit);
}

void RelayService::Disconnect(const std::string& id, const IPushChannel* channel) {
    const auto recipient_mutex = RecipientMutex(id);
    std::lock_guard recipient_lock(*recipient_mutex);
    if (connections_.Remove(id, channel)) {
        spdlog::info("Client {} disconnected", id);
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

Result<proto::wire::DiagnosticsSnapshot, RelayFailure> RelayService::Diagnostics() {
    using SnapshotResult = Result<proto::wire::DiagnosticsSnapshot, RelayFailure>;
    auto users = db_->CountUsers();
    auto bundles = db_->CountBundles();
    auto queued = db_->CountQueued();
    auto depths = db_->QueueDepthByRecipient();
    if (users.IsErr()) {
        return SnapshotResult::Err(StorageError(users.UnwrapErr()));
    }
    if (bundles.IsErr()) {
        return SnapshotResult::Err(StorageError(bundles.UnwrapErr()));
    }
    if (queued.IsErr()) {
        return SnapshotResult::Err(StorageError(queued.UnwrapErr()));
    }
    if (depths.IsErr()) {
        return SnapshotResult::Err(StorageError(depths.UnwrapErr()));
    }

    proto::wire::DiagnosticsSnapshot snapshot;
    const auto uptime = std::chrono::steady_clock::now() - started_at_;
    snapshot.set_uptime_sec(static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(uptime).count()));
    snapshot.set_db_path(db_path_);
    auto* counts = snapshot.mutable_counts();
    counts->set_users(users.Unwrap());
    counts->set_prekeys(bundles.Unwrap());
    counts->set_queued_messages(queued.Unwrap());
    counts->set_active_connections(static_cast<uint32_t>(connections_.Size()));

    auto& histogram = *snapshot.mutable_queue_depth_histogram();
    for (const char* bucket : {"0", "1-5", "6-20", "21+"}) {
        histogram[bucket] = 0;
    }
    for (const auto& [recipient, depth] : depths.Unwrap()) {
        histogram[DepthBucket(depth)] += 1;
    }

    std::lock_guard lock(metrics_mutex_);
    if (latest_metrics_.has_value()) {
        *snapshot.mutable_metrics() = *latest_metrics_;
    }
    return SnapshotResult::Ok(std::move(snapshot));
}

Result<Unit, RelayFailure> RelayService::PushMetrics(const proto::wire::HostMetrics& metrics) {
    COURIER_TRY_UNIT(RequestValidation::ValidateMetrics(metrics));
    std::lock_guard lock(metrics_mutex_);
    latest_metrics_ = metrics;
    return Result<Unit, RelayFailure>::Ok(protocol::unit);
}

}
