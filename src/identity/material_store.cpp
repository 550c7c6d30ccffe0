#include "courier/identity/material_store.hpp"
#include "courier/crypto/kyber_interop.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/debug/key_logger.hpp"
#include "courier/utilities/encoding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>

namespace courier::protocol::identity {

using crypto::KyberInterop;
using crypto::SodiumInterop;
using utilities::Encoding;

namespace {
    ProtocolFailure StorageError(const StorageFailure& failure) {
        return ProtocolFailure::FromStorageFailure(failure);
    }

    void WipeString(std::string& secret) {
        (void)SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(secret.data()), secret.size()));
    }

    void WipeBytes(std::vector<uint8_t>& secret) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
    }
}

MaterialStore::MaterialStore(std::unique_ptr<storage::RecordStore> records)
    : records_(std::move(records))
    , identity_store_(*records_)
    , session_store_(*records_)
    , pre_key_store_(*records_, records_->Config().one_time_pre_key_policy)
    , signed_pre_key_store_(*records_)
    , kyber_pre_key_store_(*records_)
    , stores_{identity_store_, session_store_, pre_key_store_, signed_pre_key_store_, kyber_pre_key_store_} {
}

Result<std::unique_ptr<MaterialStore>, StorageFailure> MaterialStore::Open(
    const std::string& path,
    std::string_view passphrase,
    const configuration::StoreConfig& config) {
    auto records = storage::RecordStore::Open(path, passphrase, config);
    if (records.IsErr()) {
        return Result<std::unique_ptr<MaterialStore>, StorageFailure>::Err(records.UnwrapErr());
    }
    if (auto kyber = KyberInterop::Initialize(); kyber.IsErr()) {
        return Result<std::unique_ptr<MaterialStore>, StorageFailure>::Err(
            StorageFailure::FromSodiumFailure(kyber.UnwrapErr()));
    }
    return Result<std::unique_ptr<MaterialStore>, StorageFailure>::Ok(
        std::unique_ptr<MaterialStore>(new MaterialStore(std::move(records).Unwrap())));
}

// ============================================================================
// Identity
// ============================================================================

Result<bool, ProtocolFailure> MaterialStore::HasIdentity() {
    auto local_id = records_->GetMeta(StoreKeys::META_LOCAL_ID);
    if (local_id.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(StorageError(local_id.UnwrapErr()));
    }
    if (!local_id.Unwrap().has_value()) {
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    auto keys = records_->ListKeysByPrefix(StoreKeys::IDENTITY_KEY_PAIR);
    if (keys.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(StorageError(keys.UnwrapErr()));
    }
    const auto& found = keys.Unwrap();
    return Result<bool, ProtocolFailure>::Ok(
        std::find(found.begin(), found.end(), StoreKeys::IDENTITY_KEY_PAIR) != found.end());
}

Result<Unit, ProtocolFailure> MaterialStore::InitializeIdentity(
    std::string_view local_id,
    std::optional<uint32_t> device_id) {
    if (local_id.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Local identity id must not be empty"));
    }
    const uint32_t device = device_id.value_or(records_->Config().default_device_id);
    if (device == 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Device id must be positive"));
    }

    const uint32_t registration_id = SodiumInterop::GenerateRandomInRange(
        Constants::MIN_REGISTRATION_ID, Constants::REGISTRATION_ID_UPPER_BOUND);

    auto generated = models::IdentityKeyPair::Generate();
    if (generated.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(generated.UnwrapErr());
    }
    auto record = generated.Unwrap().ToRecord();
    if (record.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(record.UnwrapErr());
    }

    auto persisted = records_->SetMeta(StoreKeys::META_LOCAL_ID, local_id);
    if (persisted.IsOk()) {
        persisted = records_->SetMeta(StoreKeys::META_DEVICE_ID, std::to_string(device));
    }
    if (persisted.IsOk()) {
        persisted = records_->SetMeta(StoreKeys::META_REGISTRATION_ID, std::to_string(registration_id));
    }
    if (persisted.IsOk()) {
        persisted = records_->SetMessage(StoreKeys::IDENTITY_KEY_PAIR, record.Unwrap());
    }
    WipeString(*record.Unwrap().mutable_private_key());
    if (persisted.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(StorageError(persisted.UnwrapErr()));
    }

    COURIER_LOG_KEY(debug::Side::Local, "InitializeIdentity", "identity_public", generated.Unwrap().GetPublicKey());
    spdlog::debug("Initialized identity {} (device {}, registration {})", local_id, device, registration_id);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::string, ProtocolFailure> MaterialStore::GetLocalId() {
    auto local_id = records_->GetMeta(StoreKeys::META_LOCAL_ID);
    if (local_id.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(StorageError(local_id.UnwrapErr()));
    }
    return Result<std::string, ProtocolFailure>::FromOptional(
        std::move(local_id).Unwrap(),
        ProtocolFailure::InvalidState(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
}

Result<uint32_t, ProtocolFailure> MaterialStore::GetDeviceId() {
    auto stored = records_->GetMeta(StoreKeys::META_DEVICE_ID);
    if (stored.IsErr()) {
        return Result<uint32_t, ProtocolFailure>::Err(StorageError(stored.UnwrapErr()));
    }
    const auto& text = stored.Unwrap();
    if (!text.has_value()) {
        return Result<uint32_t, ProtocolFailure>::Ok(records_->Config().default_device_id);
    }
    uint32_t device_id = 0;
    const auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), device_id);
    if (ec != std::errc() || end != text->data() + text->size()) {
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format("Stored device id '{}' is not a number", *text)));
    }
    return Result<uint32_t, ProtocolFailure>::Ok(device_id);
}

Result<uint32_t, ProtocolFailure> MaterialStore::GetRegistrationId() {
    return identity_store_.GetLocalRegistrationId();
}

Result<models::IdentityKeyPair, ProtocolFailure> MaterialStore::GetIdentityKeyPair() {
    return identity_store_.GetIdentityKeyPair();
}

// ============================================================================
// Prekeys
// ============================================================================

Result<uint32_t, ProtocolFailure> MaterialStore::NextCounter(std::string_view counter_key) {
    auto stored = records_->GetInteger(counter_key);
    if (stored.IsErr()) {
        return Result<uint32_t, ProtocolFailure>::Err(StorageError(stored.UnwrapErr()));
    }
    const auto current = static_cast<uint32_t>(stored.Unwrap().value_or(StoreKeys::COUNTER_START));
    if (auto saved = records_->SetInteger(counter_key, static_cast<int64_t>(current) + 1); saved.IsErr()) {
        return Result<uint32_t, ProtocolFailure>::Err(StorageError(saved.UnwrapErr()));
    }
    return Result<uint32_t, ProtocolFailure>::Ok(current);
}

Result<uint32_t, ProtocolFailure> MaterialStore::LatestPreKeyId(std::string_view counter_key) {
    auto stored = records_->GetInteger(counter_key);
    if (stored.IsErr()) {
        return Result<uint32_t, ProtocolFailure>::Err(StorageError(stored.UnwrapErr()));
    }
    const auto next = stored.Unwrap().value_or(StoreKeys::COUNTER_START + 1);
    return Result<uint32_t, ProtocolFailure>::Ok(static_cast<uint32_t>(next - 1));
}

Result<Unit, ProtocolFailure> MaterialStore::GeneratePreKeys(const uint32_t count) {
    auto identity_result = GetIdentityKeyPair();
    if (identity_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(identity_result.UnwrapErr());
    }
    const auto& identity = identity_result.Unwrap();

    for (uint32_t i = 0; i < count; ++i) {
        auto pre_key_id = NextCounter(StoreKeys::COUNTER_PRE_KEY);
        if (pre_key_id.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(pre_key_id.UnwrapErr());
        }
        auto pair = SodiumInterop::GenerateX25519KeyPair("one-time-prekey");
        if (pair.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(pair.UnwrapErr());
        }
        auto& [secret_key, public_key] = pair.Unwrap();
        proto::protocol::PreKeyRecord record;
        record.set_id(pre_key_id.Unwrap());
        record.set_public_key(public_key.data(), public_key.size());
        record.set_private_key(secret_key.data(), secret_key.size());
        WipeBytes(secret_key);
        auto stored = pre_key_store_.StorePreKey(record);
        WipeString(*record.mutable_private_key());
        COURIER_TRY_UNIT(stored);
    }

    auto signed_id = NextCounter(StoreKeys::COUNTER_SIGNED_PRE_KEY);
    if (signed_id.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(signed_id.UnwrapErr());
    }
    auto signed_pair = SodiumInterop::GenerateX25519KeyPair("signed-prekey");
    if (signed_pair.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(signed_pair.UnwrapErr());
    }
    auto& [signed_secret, signed_public] = signed_pair.Unwrap();
    auto signed_signature = identity.Sign(signed_public);
    if (signed_signature.IsErr()) {
        WipeBytes(signed_secret);
        return Result<Unit, ProtocolFailure>::Err(signed_signature.UnwrapErr());
    }
    proto::protocol::SignedPreKeyRecord signed_record;
    signed_record.set_id(signed_id.Unwrap());
    signed_record.set_public_key(signed_public.data(), signed_public.size());
    signed_record.set_private_key(signed_secret.data(), signed_secret.size());
    signed_record.set_signature(signed_signature.Unwrap().data(), signed_signature.Unwrap().size());
    signed_record.set_created_at(Encoding::NowMillis());
    WipeBytes(signed_secret);
    auto signed_stored = signed_pre_key_store_.StoreSignedPreKey(signed_record);
    WipeString(*signed_record.mutable_private_key());
    COURIER_TRY_UNIT(signed_stored);

    auto kyber_id = NextCounter(StoreKeys::COUNTER_KYBER_PRE_KEY);
    if (kyber_id.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(kyber_id.UnwrapErr());
    }
    auto kyber_pair = KyberInterop::GenerateKyber768KeyPair("kyber-prekey");
    if (kyber_pair.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(kyber_pair.UnwrapErr());
    }
    auto& [kyber_secret, kyber_public] = kyber_pair.Unwrap();
    auto kyber_signature = identity.Sign(kyber_public);
    if (kyber_signature.IsErr()) {
        WipeBytes(kyber_secret);
        return Result<Unit, ProtocolFailure>::Err(kyber_signature.UnwrapErr());
    }
    proto::protocol::KyberPreKeyRecord kyber_record;
    kyber_record.set_id(kyber_id.Unwrap());
    kyber_record.set_public_key(kyber_public.data(), kyber_public.size());
    kyber_record.set_secret_key(kyber_secret.data(), kyber_secret.size());
    kyber_record.set_signature(kyber_signature.Unwrap().data(), kyber_signature.Unwrap().size());
    kyber_record.set_created_at(Encoding::NowMillis());
    WipeBytes(kyber_secret);
    auto kyber_stored = kyber_pre_key_store_.StoreKyberPreKey(kyber_record);
    WipeString(*kyber_record.mutable_secret_key());
    COURIER_TRY_UNIT(kyber_stored);

    spdlog::debug("Generated {} one-time prekeys, signed prekey {}, Kyber prekey {}",
                  count, signed_id.Unwrap(), kyber_id.Unwrap());
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

// ============================================================================
// Inbox
// ============================================================================

Result<Unit, ProtocolFailure> MaterialStore::SaveInboxMessage(const proto::storage::InboxMessage& message) {
    if (message.id().empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Inbox message id must not be empty"));
    }
    proto::storage::StoredValue value;
    *value.mutable_inbox_message() = message;
    auto saved = records_->Set(compat::format("{}{}", StoreKeys::INBOX_PREFIX, message.id()), value);
    if (saved.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(StorageError(saved.UnwrapErr()));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<proto::storage::InboxMessage>, ProtocolFailure> MaterialStore::ListInboxMessages() {
    using ListResult = Result<std::vector<proto::storage::InboxMessage>, ProtocolFailure>;
    auto keys = records_->ListKeysByPrefix(StoreKeys::INBOX_PREFIX);
    if (keys.IsErr()) {
        return ListResult::Err(StorageError(keys.UnwrapErr()));
    }
    std::vector<proto::storage::InboxMessage> messages;
    for (const auto& key : keys.Unwrap()) {
        auto value = records_->Get(key);
        if (value.IsErr()) {
            return ListResult::Err(StorageError(value.UnwrapErr()));
        }
        const auto& stored = value.Unwrap();
        if (stored.has_value() && stored->has_inbox_message()) {
            messages.push_back(stored->inbox_message());
        }
    }
    std::stable_sort(messages.begin(), messages.end(),
        [](const proto::storage::InboxMessage& a, const proto::storage::InboxMessage& b) {
            return a.timestamp() < b.timestamp();
        });
    return ListResult::Ok(std::move(messages));
}

}
