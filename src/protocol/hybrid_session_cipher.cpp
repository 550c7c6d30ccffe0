#include "courier/protocol/hybrid_session_cipher.hpp"
#include "courier/protocol/constants.hpp"
#include "courier/crypto/aes_gcm.hpp"
#include "courier/crypto/hkdf.hpp"
#include "courier/crypto/kyber_interop.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/format.hpp"
#include "courier/debug/key_logger.hpp"
#include "courier/utilities/encoding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace courier::protocol {

using crypto::AesGcm;
using crypto::Hkdf;
using crypto::KyberInterop;
using crypto::SodiumInterop;
using debug::Side;

namespace {
    using Bytes = std::vector<uint8_t>;
    using BytesResult = Result<Bytes, ProtocolFailure>;

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Bytes ToVector(const std::string& bytes) {
        return {bytes.begin(), bytes.end()};
    }

    std::string Serialize(const google::protobuf::MessageLite& message) {
        std::string out;
        message.SerializeToString(&out);
        return out;
    }

    void Wipe(Bytes& secret) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
    }

    void Wipe(std::string* secret) {
        (void)SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(secret->data()), secret->size()));
    }

    struct ChainStep {
        Bytes message_key;
        Bytes next_chain_key;
    };

    Result<ChainStep, ProtocolFailure> AdvanceChain(std::span<const uint8_t> chain_key) {
        auto message_key = Hkdf::DeriveKeyBytes(chain_key, kMessageKeyBytes, {}, AsBytes(kMessageInfo));
        if (message_key.IsErr()) {
            return Result<ChainStep, ProtocolFailure>::Err(message_key.UnwrapErr());
        }
        auto next_chain_key = Hkdf::DeriveKeyBytes(chain_key, kChainKeyBytes, {}, AsBytes(kChainInfo));
        if (next_chain_key.IsErr()) {
            Wipe(message_key.Unwrap());
            return Result<ChainStep, ProtocolFailure>::Err(next_chain_key.UnwrapErr());
        }
        return Result<ChainStep, ProtocolFailure>::Ok(
            ChainStep{std::move(message_key).Unwrap(), std::move(next_chain_key).Unwrap()});
    }

    Bytes AssociatedData(std::string_view sender_identity, std::string_view receiver_identity) {
        Bytes ad;
        ad.reserve(sender_identity.size() + receiver_identity.size());
        ad.insert(ad.end(), sender_identity.begin(), sender_identity.end());
        ad.insert(ad.end(), receiver_identity.begin(), receiver_identity.end());
        return ad;
    }

    Result<Unit, ProtocolFailure> AppendDh(
        std::vector<Bytes>& outputs,
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key) {
        auto shared = SodiumInterop::ComputeSharedSecret(private_key, public_key);
        if (shared.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Handshake(compat::format("DH{} failed: {}",
                    outputs.size() + 1, shared.UnwrapErr().message)));
        }
        outputs.push_back(std::move(shared).Unwrap());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    struct HandshakeKeys {
        Bytes root_key;
        Bytes initiator_chain_key;
        Bytes responder_chain_key;
    };

    /// Consumes and wipes `dh_outputs`.
    Result<HandshakeKeys, ProtocolFailure> DeriveHandshakeKeys(
        std::vector<Bytes>& dh_outputs,
        std::span<const uint8_t> kyber_shared_secret,
        const Side side) {
        Bytes ikm(kX3dhPrefixBytes, kX3dhPrefixByte);
        for (size_t i = 0; i < dh_outputs.size(); ++i) {
            debug::LogX3dhDh(side, static_cast<int>(i + 1), dh_outputs[i]);
            ikm.insert(ikm.end(), dh_outputs[i].begin(), dh_outputs[i].end());
            Wipe(dh_outputs[i]);
        }
        dh_outputs.clear();

        const Bytes zero_salt(Hkdf::HASH_LEN, 0);
        auto classical = Hkdf::DeriveKeyBytes(ikm, kRootKeyBytes, zero_salt, AsBytes(kX3dhInfo));
        Wipe(ikm);
        if (classical.IsErr()) {
            return Result<HandshakeKeys, ProtocolFailure>::Err(classical.UnwrapErr());
        }
        auto root = KyberInterop::CombineHybridSecrets(classical.Unwrap(), kyber_shared_secret, kHybridX3dhInfo);
        debug::LogHybridCombination(side, classical.Unwrap(), kyber_shared_secret,
            root.IsOk() ? std::span<const uint8_t>(root.Unwrap()) : std::span<const uint8_t>());
        Wipe(classical.Unwrap());
        if (root.IsErr()) {
            return Result<HandshakeKeys, ProtocolFailure>::Err(root.UnwrapErr());
        }

        auto initiator_chain = Hkdf::DeriveKeyBytes(root.Unwrap(), kChainKeyBytes, {}, AsBytes(kInitiatorChainInfo));
        auto responder_chain = Hkdf::DeriveKeyBytes(root.Unwrap(), kChainKeyBytes, {}, AsBytes(kResponderChainInfo));
        if (initiator_chain.IsErr() || responder_chain.IsErr()) {
            Wipe(root.Unwrap());
            return Result<HandshakeKeys, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Failed to derive message chains"));
        }
        return Result<HandshakeKeys, ProtocolFailure>::Ok(HandshakeKeys{
            std::move(root).Unwrap(),
            std::move(initiator_chain).Unwrap(),
            std::move(responder_chain).Unwrap()});
    }

    /// Stores the peer identity key and logs a changed key. Trust is not enforced.
    Result<Unit, ProtocolFailure> RecordPeerIdentity(
        interfaces::IIdentityKeyStore& identities,
        const models::ProtocolAddress& address,
        std::span<const uint8_t> identity_key) {
        auto saved = identities.SaveIdentity(address, identity_key);
        if (saved.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(saved.UnwrapErr());
        }
        if (saved.Unwrap() == interfaces::IdentityChange::ReplacedExisting) {
            spdlog::warn("Identity key for {} changed", address.ToString());
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void FillSession(
        proto::protocol::SessionRecord& session,
        HandshakeKeys& keys,
        const bool is_initiator) {
        session.set_version(kProtocolVersion);
        session.set_is_initiator(is_initiator);
        session.set_root_key(keys.root_key.data(), keys.root_key.size());
        const Bytes& sending = is_initiator ? keys.initiator_chain_key : keys.responder_chain_key;
        const Bytes& receiving = is_initiator ? keys.responder_chain_key : keys.initiator_chain_key;
        session.set_sending_chain_key(sending.data(), sending.size());
        session.set_sending_index(0);
        session.set_receiving_chain_key(receiving.data(), receiving.size());
        session.set_receiving_index(0);
        session.set_created_at(utilities::Encoding::NowMillis());
        Wipe(keys.root_key);
        Wipe(keys.initiator_chain_key);
        Wipe(keys.responder_chain_key);
    }
}

// ============================================================================
// Session establishment
// ============================================================================

Result<Unit, ProtocolFailure> HybridSessionCipher::ProcessPreKeyBundle(
    const models::PreKeyBundle& bundle,
    const models::ProtocolAddress& address,
    interfaces::ProtocolStores& stores) {
    COURIER_TRY_UNIT(bundle.VerifySignatures());
    COURIER_TRY_UNIT(KyberInterop::ValidatePublicKey(bundle.GetKyberPreKey().public_key));

    auto identity = stores.identity.GetIdentityKeyPair();
    if (identity.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(identity.UnwrapErr());
    }
    auto registration_id = stores.identity.GetLocalRegistrationId();
    if (registration_id.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(registration_id.UnwrapErr());
    }
    auto peer_identity = SodiumInterop::Ed25519PublicKeyToX25519(bundle.GetIdentityKey());
    if (peer_identity.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("Bundle identity key is not a valid Ed25519 key"));
    }
    auto own_secret = identity.Unwrap().GetX25519SecretKey();
    if (own_secret.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(own_secret.UnwrapErr());
    }
    auto ephemeral = SodiumInterop::GenerateX25519KeyPair("handshake-ephemeral");
    if (ephemeral.IsErr()) {
        Wipe(own_secret.Unwrap());
        return Result<Unit, ProtocolFailure>::Err(ephemeral.UnwrapErr());
    }
    auto& ephemeral_secret = ephemeral.Unwrap().first;
    const auto& ephemeral_public = ephemeral.Unwrap().second;

    COURIER_LOG_SECTION(Side::Initiator, "HANDSHAKE");
    const auto& signed_pre_key = bundle.GetSignedPreKey().public_key;
    std::vector<Bytes> dh_outputs;
    auto agreed = [&]() -> Result<Unit, ProtocolFailure> {
        COURIER_TRY_UNIT(AppendDh(dh_outputs, own_secret.Unwrap(), signed_pre_key));
        COURIER_TRY_UNIT(AppendDh(dh_outputs, ephemeral_secret, peer_identity.Unwrap()));
        COURIER_TRY_UNIT(AppendDh(dh_outputs, ephemeral_secret, signed_pre_key));
        if (bundle.GetPreKey().has_value()) {
            COURIER_TRY_UNIT(AppendDh(dh_outputs, ephemeral_secret, bundle.GetPreKey()->public_key));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }();
    Wipe(own_secret.Unwrap());
    Wipe(ephemeral_secret);
    if (agreed.IsErr()) {
        for (auto& output : dh_outputs) {
            Wipe(output);
        }
        return agreed;
    }

    auto encapsulated = KyberInterop::Encapsulate(bundle.GetKyberPreKey().public_key);
    if (encapsulated.IsErr()) {
        for (auto& output : dh_outputs) {
            Wipe(output);
        }
        return Result<Unit, ProtocolFailure>::Err(encapsulated.UnwrapErr());
    }
    auto& [kyber_ciphertext, kyber_shared_secret] = encapsulated.Unwrap();
    auto keys = DeriveHandshakeKeys(dh_outputs, kyber_shared_secret, Side::Initiator);
    Wipe(kyber_shared_secret);
    if (keys.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(keys.UnwrapErr());
    }

    proto::protocol::SessionRecord session;
    FillSession(session, keys.Unwrap(), true);
    const auto& own_public = identity.Unwrap().GetPublicKey();
    session.set_local_identity_key(own_public.data(), own_public.size());
    session.set_remote_identity_key(bundle.GetIdentityKey().data(), bundle.GetIdentityKey().size());
    session.set_local_registration_id(registration_id.Unwrap());
    session.set_remote_registration_id(bundle.GetRegistrationId());

    auto* pending = session.mutable_pending_pre_key();
    pending->set_has_pre_key(bundle.GetPreKey().has_value());
    pending->set_pre_key_id(bundle.GetPreKey().has_value() ? bundle.GetPreKey()->id : 0);
    pending->set_signed_pre_key_id(bundle.GetSignedPreKey().id);
    pending->set_kyber_pre_key_id(bundle.GetKyberPreKey().id);
    pending->set_base_key(ephemeral_public.data(), ephemeral_public.size());
    pending->set_kyber_ciphertext(kyber_ciphertext.data(), kyber_ciphertext.size());

    COURIER_TRY_UNIT(RecordPeerIdentity(stores.identity, address, bundle.GetIdentityKey()));
    auto stored = stores.sessions.StoreSession(address, session);
    Wipe(session.mutable_root_key());
    Wipe(session.mutable_sending_chain_key());
    Wipe(session.mutable_receiving_chain_key());
    return stored;
}

Result<proto::protocol::SessionRecord, ProtocolFailure> HybridSessionCipher::AcceptHandshake(
    const proto::protocol::PreKeyCipherMessage& message,
    interfaces::ProtocolStores& stores) {
    using SessionResult = Result<proto::protocol::SessionRecord, ProtocolFailure>;

    auto identity = stores.identity.GetIdentityKeyPair();
    if (identity.IsErr()) {
        return SessionResult::Err(identity.UnwrapErr());
    }
    auto registration_id = stores.identity.GetLocalRegistrationId();
    if (registration_id.IsErr()) {
        return SessionResult::Err(registration_id.UnwrapErr());
    }
    auto signed_pre_key = stores.signed_pre_keys.LoadSignedPreKey(message.signed_pre_key_id());
    if (signed_pre_key.IsErr()) {
        return SessionResult::Err(signed_pre_key.UnwrapErr());
    }
    auto kyber_pre_key = stores.kyber_pre_keys.LoadKyberPreKey(message.kyber_pre_key_id());
    if (kyber_pre_key.IsErr()) {
        return SessionResult::Err(kyber_pre_key.UnwrapErr());
    }
    std::optional<proto::protocol::PreKeyRecord> one_time_pre_key;
    if (message.has_pre_key()) {
        auto loaded = stores.pre_keys.LoadPreKey(message.pre_key_id());
        if (loaded.IsErr()) {
            return SessionResult::Err(loaded.UnwrapErr());
        }
        one_time_pre_key = std::move(loaded).Unwrap();
    }

    auto wipe_records = [&]() {
        Wipe(signed_pre_key.Unwrap().mutable_private_key());
        Wipe(kyber_pre_key.Unwrap().mutable_secret_key());
        if (one_time_pre_key.has_value()) {
            Wipe(one_time_pre_key->mutable_private_key());
        }
    };

    if (auto valid = KyberInterop::ValidateCiphertext(AsBytes(message.kyber_ciphertext())); valid.IsErr()) {
        wipe_records();
        return SessionResult::Err(valid.UnwrapErr());
    }
    auto kyber_shared_secret = KyberInterop::Decapsulate(
        AsBytes(message.kyber_ciphertext()), AsBytes(kyber_pre_key.Unwrap().secret_key()));
    if (kyber_shared_secret.IsErr()) {
        wipe_records();
        return SessionResult::Err(kyber_shared_secret.UnwrapErr());
    }
    auto peer_identity = SodiumInterop::Ed25519PublicKeyToX25519(AsBytes(message.identity_key()));
    if (peer_identity.IsErr()) {
        wipe_records();
        Wipe(kyber_shared_secret.Unwrap());
        return SessionResult::Err(ProtocolFailure::PeerPubKey("Sender identity key is not a valid Ed25519 key"));
    }
    auto own_secret = identity.Unwrap().GetX25519SecretKey();
    if (own_secret.IsErr()) {
        wipe_records();
        Wipe(kyber_shared_secret.Unwrap());
        return SessionResult::Err(own_secret.UnwrapErr());
    }

    COURIER_LOG_SECTION(Side::Responder, "HANDSHAKE");
    const auto base_key = AsBytes(message.base_key());
    const auto signed_secret = AsBytes(signed_pre_key.Unwrap().private_key());
    std::vector<Bytes> dh_outputs;
    auto agreed = [&]() -> Result<Unit, ProtocolFailure> {
        COURIER_TRY_UNIT(AppendDh(dh_outputs, signed_secret, peer_identity.Unwrap()));
        COURIER_TRY_UNIT(AppendDh(dh_outputs, own_secret.Unwrap(), base_key));
        COURIER_TRY_UNIT(AppendDh(dh_outputs, signed_secret, base_key));
        if (one_time_pre_key.has_value()) {
            COURIER_TRY_UNIT(AppendDh(dh_outputs, AsBytes(one_time_pre_key->private_key()), base_key));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }();
    Wipe(own_secret.Unwrap());
    wipe_records();
    if (agreed.IsErr()) {
        for (auto& output : dh_outputs) {
            Wipe(output);
        }
        Wipe(kyber_shared_secret.Unwrap());
        return SessionResult::Err(agreed.UnwrapErr());
    }

    auto keys = DeriveHandshakeKeys(dh_outputs, kyber_shared_secret.Unwrap(), Side::Responder);
    Wipe(kyber_shared_secret.Unwrap());
    if (keys.IsErr()) {
        return SessionResult::Err(keys.UnwrapErr());
    }

    proto::protocol::SessionRecord session;
    FillSession(session, keys.Unwrap(), false);
    const auto& own_public = identity.Unwrap().GetPublicKey();
    session.set_local_identity_key(own_public.data(), own_public.size());
    session.set_remote_identity_key(message.identity_key());
    session.set_local_registration_id(registration_id.Unwrap());
    session.set_remote_registration_id(message.registration_id());
    session.set_handshake_base_key(message.base_key());
    return SessionResult::Ok(std::move(session));
}

// ============================================================================
// Messages
// ============================================================================

Result<models::CiphertextMessage, ProtocolFailure> HybridSessionCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    const models::ProtocolAddress& address,
    interfaces::ProtocolStores& stores) {
    using EncryptResult = Result<models::CiphertextMessage, ProtocolFailure>;

    auto loaded = stores.sessions.LoadSession(address);
    if (loaded.IsErr()) {
        return EncryptResult::Err(loaded.UnwrapErr());
    }
    if (!loaded.Unwrap().has_value()) {
        return EncryptResult::Err(ProtocolFailure::InvalidState(
            compat::format("No session with {}", address.ToString())));
    }
    auto session = std::move(*loaded.Unwrap());

    auto step = AdvanceChain(AsBytes(session.sending_chain_key()));
    if (step.IsErr()) {
        return EncryptResult::Err(step.UnwrapErr());
    }
    auto& keys = step.Unwrap();
    const uint32_t index = session.sending_index();
    debug::LogChainStep(session.is_initiator() ? Side::Initiator : Side::Responder, "SEND", index, keys.message_key);

    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto ad = AssociatedData(session.local_identity_key(), session.remote_identity_key());
    auto ciphertext = AesGcm::Encrypt(keys.message_key, nonce, plaintext, ad);
    Wipe(keys.message_key);
    if (ciphertext.IsErr()) {
        Wipe(keys.next_chain_key);
        return EncryptResult::Err(ciphertext.UnwrapErr());
    }

    proto::protocol::CipherMessage message;
    message.set_counter(index);
    message.set_nonce(nonce.data(), nonce.size());
    message.set_ciphertext(ciphertext.Unwrap().data(), ciphertext.Unwrap().size());

    session.set_sending_chain_key(keys.next_chain_key.data(), keys.next_chain_key.size());
    session.set_sending_index(index + 1);
    Wipe(keys.next_chain_key);

    models::CiphertextMessage out;
    if (session.has_pending_pre_key()) {
        const auto& pending = session.pending_pre_key();
        proto::protocol::PreKeyCipherMessage pre_key_message;
        pre_key_message.set_registration_id(session.local_registration_id());
        pre_key_message.set_has_pre_key(pending.has_pre_key());
        pre_key_message.set_pre_key_id(pending.pre_key_id());
        pre_key_message.set_signed_pre_key_id(pending.signed_pre_key_id());
        pre_key_message.set_kyber_pre_key_id(pending.kyber_pre_key_id());
        pre_key_message.set_base_key(pending.base_key());
        pre_key_message.set_identity_key(session.local_identity_key());
        pre_key_message.set_kyber_ciphertext(pending.kyber_ciphertext());
        *pre_key_message.mutable_message() = std::move(message);
        out.type = kCiphertextTypePreKey;
        const auto serialized = Serialize(pre_key_message);
        out.bytes.assign(serialized.begin(), serialized.end());
    } else {
        out.type = kCiphertextTypeEstablished;
        const auto serialized = Serialize(message);
        out.bytes.assign(serialized.begin(), serialized.end());
    }

    auto stored = stores.sessions.StoreSession(address, session);
    if (stored.IsErr()) {
        return EncryptResult::Err(stored.UnwrapErr());
    }
    return EncryptResult::Ok(std::move(out));
}

Result<std::vector<uint8_t>, ProtocolFailure> HybridSessionCipher::DecryptWithSession(
    proto::protocol::SessionRecord& session,
    const proto::protocol::CipherMessage& message) {
    if (message.nonce().size() != kAesGcmNonceBytes) {
        return BytesResult::Err(ProtocolFailure::Decode(
            compat::format("Message nonce must be {} bytes", kAesGcmNonceBytes)));
    }

    const uint32_t counter = message.counter();
    Bytes message_key;
    if (counter < session.receiving_index()) {
        auto* skipped = session.mutable_skipped_keys();
        auto it = std::find_if(skipped->begin(), skipped->end(),
            [counter](const proto::protocol::SkippedMessageKey& key) { return key.index() == counter; });
        if (it == skipped->end()) {
            return BytesResult::Err(ProtocolFailure::DuplicateMessage(
                compat::format("Message {} was already received", counter)));
        }
        message_key = ToVector(it->message_key());
        skipped->erase(it);
    } else {
        if (counter - session.receiving_index() > kMaxSkippedMessageKeys) {
            return BytesResult::Err(ProtocolFailure::InvalidInput(compat::format(
                "Message {} skips more than {} keys", counter, kMaxSkippedMessageKeys)));
        }
        Bytes chain_key = ToVector(session.receiving_chain_key());
        for (uint32_t index = session.receiving_index();; ++index) {
            auto step = AdvanceChain(chain_key);
            Wipe(chain_key);
            if (step.IsErr()) {
                return BytesResult::Err(step.UnwrapErr());
            }
            auto& keys = step.Unwrap();
            chain_key = std::move(keys.next_chain_key);
            if (index == counter) {
                message_key = std::move(keys.message_key);
                break;
            }
            auto* entry = session.add_skipped_keys();
            entry->set_index(index);
            entry->set_message_key(keys.message_key.data(), keys.message_key.size());
            Wipe(keys.message_key);
        }
        session.set_receiving_chain_key(chain_key.data(), chain_key.size());
        session.set_receiving_index(counter + 1);
        Wipe(chain_key);
        while (static_cast<size_t>(session.skipped_keys_size()) > kMaxSkippedMessageKeys) {
            session.mutable_skipped_keys()->DeleteSubrange(0, 1);
        }
    }
    debug::LogChainStep(session.is_initiator() ? Side::Initiator : Side::Responder, "RECV", counter, message_key);

    const auto ad = AssociatedData(session.remote_identity_key(), session.local_identity_key());
    auto plaintext = AesGcm::Decrypt(message_key, AsBytes(message.nonce()), AsBytes(message.ciphertext()), ad);
    Wipe(message_key);
    if (plaintext.IsErr()) {
        return BytesResult::Err(ProtocolFailure::Decode(
            compat::format("Message {} failed authentication", counter)));
    }
    return plaintext;
}

Result<std::vector<uint8_t>, ProtocolFailure> HybridSessionCipher::Decrypt(
    std::span<const uint8_t> message_bytes,
    const models::ProtocolAddress& address,
    interfaces::ProtocolStores& stores) {
    proto::protocol::CipherMessage message;
    if (!message.ParseFromArray(message_bytes.data(), static_cast<int>(message_bytes.size()))) {
        return BytesResult::Err(ProtocolFailure::Decode("Malformed session message"));
    }
    auto loaded = stores.sessions.LoadSession(address);
    if (loaded.IsErr()) {
        return BytesResult::Err(loaded.UnwrapErr());
    }
    if (!loaded.Unwrap().has_value()) {
        return BytesResult::Err(ProtocolFailure::InvalidState(
            compat::format("No session with {}", address.ToString())));
    }
    auto session = std::move(*loaded.Unwrap());

    auto plaintext = DecryptWithSession(session, message);
    if (plaintext.IsErr()) {
        return plaintext;
    }
    // The responder answered, so the handshake no longer needs repeating.
    if (session.is_initiator() && session.has_pending_pre_key()) {
        session.clear_pending_pre_key();
    }
    auto stored = stores.sessions.StoreSession(address, session);
    if (stored.IsErr()) {
        Wipe(plaintext.Unwrap());
        return BytesResult::Err(stored.UnwrapErr());
    }
    return plaintext;
}

Result<std::vector<uint8_t>, ProtocolFailure> HybridSessionCipher::DecryptPreKey(
    std::span<const uint8_t> message_bytes,
    const models::ProtocolAddress& address,
    interfaces::ProtocolStores& stores) {
    proto::protocol::PreKeyCipherMessage message;
    if (!message.ParseFromArray(message_bytes.data(), static_cast<int>(message_bytes.size())) ||
        !message.has_message()) {
        return BytesResult::Err(ProtocolFailure::Decode("Malformed prekey message"));
    }
    if (message.identity_key().size() != kEd25519PublicKeyBytes ||
        message.base_key().size() != kX25519PublicKeyBytes) {
        return BytesResult::Err(ProtocolFailure::Decode("Prekey message carries malformed keys"));
    }

    auto loaded = stores.sessions.LoadSession(address);
    if (loaded.IsErr()) {
        return BytesResult::Err(loaded.UnwrapErr());
    }
    const auto& existing = loaded.Unwrap();
    if (existing.has_value() && !existing->is_initiator() &&
        existing->handshake_base_key() == message.base_key()) {
        auto session = *existing;
        auto plaintext = DecryptWithSession(session, message.message());
        if (plaintext.IsErr()) {
            return plaintext;
        }
        auto stored = stores.sessions.StoreSession(address, session);
        if (stored.IsErr()) {
            Wipe(plaintext.Unwrap());
            return BytesResult::Err(stored.UnwrapErr());
        }
        return plaintext;
    }

    auto accepted = AcceptHandshake(message, stores);
    if (accepted.IsErr()) {
        return BytesResult::Err(accepted.UnwrapErr());
    }
    auto session = std::move(accepted).Unwrap();
    auto plaintext = DecryptWithSession(session, message.message());
    if (plaintext.IsErr()) {
        return plaintext;
    }

    auto committed = [&]() -> Result<Unit, ProtocolFailure> {
        COURIER_TRY_UNIT(RecordPeerIdentity(stores.identity, address, AsBytes(message.identity_key())));
        COURIER_TRY_UNIT(stores.sessions.StoreSession(address, session));
        if (message.has_pre_key()) {
            COURIER_TRY_UNIT(stores.pre_keys.RemovePreKey(message.pre_key_id()));
        }
        return stores.kyber_pre_keys.MarkKyberPreKeyUsed(
            message.kyber_pre_key_id(), message.signed_pre_key_id(), AsBytes(message.base_key()));
    }();
    Wipe(session.mutable_root_key());
    Wipe(session.mutable_sending_chain_key());
    Wipe(session.mutable_receiving_chain_key());
    if (committed.IsErr()) {
        Wipe(plaintext.Unwrap());
        return BytesResult::Err(committed.UnwrapErr());
    }
    return plaintext;
}

}
