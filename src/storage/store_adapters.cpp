#include "courier/storage/store_adapters.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/encoding.hpp"
#include <algorithm>
#include <charconv>

namespace courier::protocol::storage {

using crypto::SodiumInterop;
using interfaces::IdentityChange;
using utilities::Encoding;

namespace {
    std::string RecordKey(std::string_view prefix, const uint32_t id) {
        return compat::format("{}{}", prefix, id);
    }

    std::string RecordKey(std::string_view prefix, const models::ProtocolAddress& address) {
        return compat::format("{}{}", prefix, address.ToString());
    }

    template<typename M>
    Result<M, ProtocolFailure> RequireRecord(
        RecordStore& store,
        const std::string& key,
        std::string_view category,
        const uint32_t id) {
        M record;
        auto found = store.GetMessage(key, record);
        if (found.IsErr()) {
            return Result<M, ProtocolFailure>::Err(ProtocolFailure::FromStorageFailure(found.UnwrapErr()));
        }
        if (!found.Unwrap()) {
            return Result<M, ProtocolFailure>::Err(
                ProtocolFailure::MaterialNotFound(compat::format("{} {} not found", category, id)));
        }
        return Result<M, ProtocolFailure>::Ok(std::move(record));
    }

    Result<Unit, ProtocolFailure> SaveRecord(
        RecordStore& store,
        const std::string& key,
        const google::protobuf::MessageLite& record) {
        auto saved = store.SetMessage(key, record);
        if (saved.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::FromStorageFailure(saved.UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

// ============================================================================
// Identity
// ============================================================================

Result<models::IdentityKeyPair, ProtocolFailure> RecordIdentityKeyStore::GetIdentityKeyPair() {
    proto::protocol::IdentityKeyPairRecord record;
    auto found = store_.GetMessage(StoreKeys::IDENTITY_KEY_PAIR, record);
    if (found.IsErr()) {
        return Result<models::IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromStorageFailure(found.UnwrapErr()));
    }
    if (!found.Unwrap()) {
        return Result<models::IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    auto pair = models::IdentityKeyPair::FromRecord(record);
    auto* secret = record.mutable_private_key();
    (void)SodiumInterop::SecureWipe(
        std::span<uint8_t>(reinterpret_cast<uint8_t*>(secret->data()), secret->size()));
    return pair;
}

Result<uint32_t, ProtocolFailure> RecordIdentityKeyStore::GetLocalRegistrationId() {
    auto stored = store_.GetMeta(StoreKeys::META_REGISTRATION_ID);
    if (stored.IsErr()) {
        return Result<uint32_t, ProtocolFailure>::Err(ProtocolFailure::FromStorageFailure(stored.UnwrapErr()));
    }
    const auto& text = stored.Unwrap();
    if (!text.has_value()) {
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    uint32_t registration_id = 0;
    const auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), registration_id);
    if (ec != std::errc() || end != text->data() + text->size()) {
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format("Stored registration id '{}' is not a number", *text)));
    }
    return Result<uint32_t, ProtocolFailure>::Ok(registration_id);
}

Result<IdentityChange, ProtocolFailure> RecordIdentityKeyStore::SaveIdentity(
    const models::ProtocolAddress& address,
    std::span<const uint8_t> identity_key) {
    const auto key = RecordKey(StoreKeys::IDENTITY_PREFIX, address);
    auto existing = store_.GetBytes(key);
    if (existing.IsErr()) {
        return Result<IdentityChange, ProtocolFailure>::Err(
            ProtocolFailure::FromStorageFailure(existing.UnwrapErr()));
    }
    auto saved = store_.SetBytes(key, identity_key);
    if (saved.IsErr()) {
        return Result<IdentityChange, ProtocolFailure>::Err(
            ProtocolFailure::FromStorageFailure(saved.UnwrapErr()));
    }
    const auto& previous = existing.Unwrap();
    if (previous.has_value() &&
        !std::equal(previous->begin(), previous->end(), identity_key.begin(), identity_key.end())) {
        return Result<IdentityChange, ProtocolFailure>::Ok(IdentityChange::ReplacedExisting);
    }
    return Result<IdentityChange, ProtocolFailure>::Ok(IdentityChange::NewOrUnchanged);
}

Result<bool, ProtocolFailure> RecordIdentityKeyStore::IsTrustedIdentity(
    const models::ProtocolAddress& address,
    std::span<const uint8_t> identity_key) {
    auto existing = GetIdentity(address);
    if (existing.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(existing.UnwrapErr());
    }
    const auto& stored = existing.Unwrap();
    if (!stored.has_value()) {
        return Result<bool, ProtocolFailure>::Ok(true);
    }
    return Result<bool, ProtocolFailure>::Ok(
        std::equal(stored->begin(), stored->end(), identity_key.begin(), identity_key.end()));
}

Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> RecordIdentityKeyStore::GetIdentity(
    const models::ProtocolAddress& address) {
    auto stored = store_.GetBytes(RecordKey(StoreKeys::IDENTITY_PREFIX, address));
    if (stored.IsErr()) {
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Err(
            ProtocolFailure::FromStorageFailure(stored.UnwrapErr()));
    }
    return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(std::move(stored).Unwrap());
}

// ============================================================================
// Sessions
// ============================================================================

Result<std::optional<proto::protocol::SessionRecord>, ProtocolFailure> RecordSessionStore::LoadSession(
    const models::ProtocolAddress& address) {
    using LoadResult = Result<std::optional<proto::protocol::SessionRecord>, ProtocolFailure>;
    proto::protocol::SessionRecord record;
    auto found = store_.GetMessage(RecordKey(StoreKeys::SESSION_PREFIX, address), record);
    if (found.IsErr()) {
        return LoadResult::Err(ProtocolFailure::FromStorageFailure(found.UnwrapErr()));
    }
    if (!found.Unwrap()) {
        return LoadResult::Ok(std::nullopt);
    }
    return LoadResult::Ok(std::move(record));
}

Result<Unit, ProtocolFailure> RecordSessionStore::StoreSession(
    const models::ProtocolAddress& address,
    const proto::protocol::SessionRecord& record) {
    return SaveRecord(store_, RecordKey(StoreKeys::SESSION_PREFIX, address), record);
}

// ============================================================================
// One-time prekeys
// ============================================================================

Result<proto::protocol::PreKeyRecord, ProtocolFailure> RecordPreKeyStore::LoadPreKey(const uint32_t pre_key_id) {
    return RequireRecord<proto::protocol::PreKeyRecord>(
        store_, RecordKey(StoreKeys::PRE_KEY_PREFIX, pre_key_id), "PreKey", pre_key_id);
}

Result<Unit, ProtocolFailure> RecordPreKeyStore::StorePreKey(const proto::protocol::PreKeyRecord& record) {
    return SaveRecord(store_, RecordKey(StoreKeys::PRE_KEY_PREFIX, record.id()), record);
}

Result<Unit, ProtocolFailure> RecordPreKeyStore::RemovePreKey(const uint32_t pre_key_id) {
    if (policy_ == configuration::OneTimePreKeyPolicy::Delete) {
        auto deleted = store_.Delete(RecordKey(StoreKeys::PRE_KEY_PREFIX, pre_key_id));
        if (deleted.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::FromStorageFailure(deleted.UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    proto::protocol::PreKeyUsedMarker marker;
    marker.set_used_at(Encoding::NowMillis());
    return SaveRecord(store_, RecordKey(StoreKeys::PRE_KEY_USED_PREFIX, pre_key_id), marker);
}

// ============================================================================
// Signed prekeys
// ============================================================================

Result<proto::protocol::SignedPreKeyRecord, ProtocolFailure> RecordSignedPreKeyStore::LoadSignedPreKey(
    const uint32_t signed_pre_key_id) {
    return RequireRecord<proto::protocol::SignedPreKeyRecord>(
        store_, RecordKey(StoreKeys::SIGNED_PRE_KEY_PREFIX, signed_pre_key_id), "SignedPreKey", signed_pre_key_id);
}

Result<Unit, ProtocolFailure> RecordSignedPreKeyStore::StoreSignedPreKey(
    const proto::protocol::SignedPreKeyRecord& record) {
    return SaveRecord(store_, RecordKey(StoreKeys::SIGNED_PRE_KEY_PREFIX, record.id()), record);
}

// ============================================================================
// Kyber prekeys
// ============================================================================

Result<proto::protocol::KyberPreKeyRecord, ProtocolFailure> RecordKyberPreKeyStore::LoadKyberPreKey(
    const uint32_t kyber_pre_key_id) {
    return RequireRecord<proto::protocol::KyberPreKeyRecord>(
        store_, RecordKey(StoreKeys::KYBER_PRE_KEY_PREFIX, kyber_pre_key_id), "KyberPreKey", kyber_pre_key_id);
}

Result<Unit, ProtocolFailure> RecordKyberPreKeyStore::StoreKyberPreKey(
    const proto::protocol::KyberPreKeyRecord& record) {
    return SaveRecord(store_, RecordKey(StoreKeys::KYBER_PRE_KEY_PREFIX, record.id()), record);
}

Result<Unit, ProtocolFailure> RecordKyberPreKeyStore::MarkKyberPreKeyUsed(
    const uint32_t kyber_pre_key_id,
    const uint32_t signed_pre_key_id,
    std::span<const uint8_t> base_key) {
    proto::protocol::KyberPreKeyUsedMarker marker;
    marker.set_signed_pre_key_id(signed_pre_key_id);
    marker.set_base_key(base_key.data(), base_key.size());
    marker.set_used_at(Encoding::NowMillis());
    return SaveRecord(store_, RecordKey(StoreKeys::KYBER_PRE_KEY_USED_PREFIX, kyber_pre_key_id), marker);
}

}
