#include "courier/storage/record_store.hpp"
#include "courier/crypto/aes_gcm.hpp"
#include "courier/crypto/passphrase_kdf.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/encoding.hpp"
#include <spdlog/spdlog.h>

namespace courier::protocol::storage {

using crypto::AesGcm;
using crypto::SodiumInterop;
using utilities::Encoding;

namespace {
    constexpr std::string_view kCreateMetaTable =
        "CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value BLOB NOT NULL)";
    constexpr std::string_view kCreateKvTable =
        "CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB NOT NULL)";

    Result<std::optional<std::vector<uint8_t>>, StorageFailure> ReadBlob(
        SqliteDatabase& db,
        std::string_view sql,
        std::string_view key) {
        using ReadResult = Result<std::optional<std::vector<uint8_t>>, StorageFailure>;
        auto stmt_result = db.Prepare(sql);
        if (stmt_result.IsErr()) {
            return ReadResult::Err(stmt_result.UnwrapErr());
        }
        auto stmt = std::move(stmt_result).Unwrap();
        if (auto bound = stmt.BindText(1, key); bound.IsErr()) {
            return ReadResult::Err(bound.UnwrapErr());
        }
        auto row = stmt.Step();
        if (row.IsErr()) {
            return ReadResult::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            return ReadResult::Ok(std::nullopt);
        }
        return ReadResult::Ok(stmt.ColumnBlob(0));
    }

    Result<Unit, StorageFailure> WriteBlob(
        SqliteDatabase& db,
        std::string_view sql,
        std::string_view key,
        std::span<const uint8_t> value) {
        auto stmt_result = db.Prepare(sql);
        if (stmt_result.IsErr()) {
            return Result<Unit, StorageFailure>::Err(stmt_result.UnwrapErr());
        }
        auto stmt = std::move(stmt_result).Unwrap();
        COURIER_TRY_UNIT(stmt.BindText(1, key));
        COURIER_TRY_UNIT(stmt.BindBlob(2, value));
        return stmt.Run();
    }

    Result<std::optional<std::vector<uint8_t>>, StorageFailure> ReadMeta(
        SqliteDatabase& db, std::string_view key) {
        return ReadBlob(db, "SELECT value FROM meta WHERE key = ?1", key);
    }

    Result<Unit, StorageFailure> WriteMeta(
        SqliteDatabase& db, std::string_view key, std::span<const uint8_t> value) {
        return WriteBlob(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?1, ?2)", key, value);
    }

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    StorageFailure WrongArm(std::string_view key, std::string_view expected) {
        return StorageFailure::Decode(compat::format("Record {} does not hold {}", key, expected));
    }
}

RecordStore::RecordStore(std::unique_ptr<SqliteDatabase> db,
                         crypto::SecureMemoryHandle key,
                         configuration::StoreConfig config)
    : db_(std::move(db))
    , key_(std::move(key))
    , config_(config)
    , path_(db_->Path()) {
}

Result<std::unique_ptr<RecordStore>, StorageFailure> RecordStore::Open(
    const std::string& path,
    std::string_view passphrase,
    const configuration::StoreConfig& config) {
    using OpenResult = Result<std::unique_ptr<RecordStore>, StorageFailure>;

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return OpenResult::Err(StorageFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto db_result = SqliteDatabase::Open(path);
    if (db_result.IsErr()) {
        return OpenResult::Err(db_result.UnwrapErr());
    }
    auto db = std::move(db_result).Unwrap();

    if (auto schema = CreateSchema(*db); schema.IsErr()) {
        return OpenResult::Err(schema.UnwrapErr());
    }

    auto kdf_result = LoadOrCreateKdfParameters(*db, config);
    if (kdf_result.IsErr()) {
        return OpenResult::Err(kdf_result.UnwrapErr());
    }
    const auto& kdf = kdf_result.Unwrap();

    const crypto::ScryptParameters params{
        kdf.n(), kdf.r(), kdf.p(), static_cast<size_t>(kdf.key_length())};
    const auto& salt = kdf.salt();
    auto key_result = crypto::PassphraseKdf::DeriveKey(
        passphrase,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        params);
    if (key_result.IsErr()) {
        return OpenResult::Err(key_result.UnwrapErr());
    }

    spdlog::debug("Opened record store at {}", path);
    return OpenResult::Ok(std::unique_ptr<RecordStore>(
        new RecordStore(std::move(db), std::move(key_result).Unwrap(), config)));
}

Result<Unit, StorageFailure> RecordStore::CreateSchema(SqliteDatabase& db) {
    COURIER_TRY_UNIT(db.Execute("PRAGMA journal_mode=WAL"));
    COURIER_TRY_UNIT(db.Execute(kCreateMetaTable));
    return db.Execute(kCreateKvTable);
}

Result<proto::storage::KdfParameters, StorageFailure> RecordStore::LoadOrCreateKdfParameters(
    SqliteDatabase& db,
    const configuration::StoreConfig& config) {
    using KdfResult = Result<proto::storage::KdfParameters, StorageFailure>;

    auto existing = ReadMeta(db, StoreKeys::META_KDF);
    if (existing.IsErr()) {
        return KdfResult::Err(existing.UnwrapErr());
    }

    if (const auto& blob = existing.Unwrap(); blob.has_value()) {
        proto::storage::StoredValue stored;
        if (!stored.ParseFromArray(blob->data(), static_cast<int>(blob->size())) ||
            !stored.has_kdf_parameters()) {
            return KdfResult::Err(StorageFailure::Decode("Stored KDF parameters are unreadable"));
        }
        const auto& kdf = stored.kdf_parameters();
        if (kdf.salt().empty() || kdf.n() == 0 || kdf.r() == 0 || kdf.p() == 0 ||
            kdf.key_length() != Constants::AES_KEY_SIZE) {
            return KdfResult::Err(StorageFailure::Decode("Stored KDF parameters are invalid"));
        }
        return KdfResult::Ok(kdf);
    }

    proto::storage::StoredValue stored;
    auto* kdf = stored.mutable_kdf_parameters();
    const auto salt = SodiumInterop::GetRandomBytes(config.salt_length);
    kdf->set_salt(salt.data(), salt.size());
    kdf->set_n(config.scrypt_n);
    kdf->set_r(config.scrypt_r);
    kdf->set_p(config.scrypt_p);
    kdf->set_key_length(static_cast<uint32_t>(config.key_length));

    std::string serialized;
    if (!stored.SerializeToString(&serialized)) {
        return KdfResult::Err(StorageFailure::Decode("Failed to serialize KDF parameters"));
    }
    if (auto written = WriteMeta(db, StoreKeys::META_KDF, AsBytes(serialized)); written.IsErr()) {
        return KdfResult::Err(written.UnwrapErr());
    }
    return KdfResult::Ok(stored.kdf_parameters());
}

// ============================================================================
// Sealing
// ============================================================================

Result<std::vector<uint8_t>, StorageFailure> RecordStore::Seal(
    std::string_view key,
    std::span<const uint8_t> plaintext) const {
    using SealResult = Result<std::vector<uint8_t>, StorageFailure>;

    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> aes_key) {
        return AesGcm::Encrypt(aes_key, nonce, plaintext, AsBytes(key));
    });
    if (sealed.IsErr()) {
        return SealResult::Err(StorageFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto& encrypted = sealed.Unwrap();
    if (encrypted.IsErr()) {
        return SealResult::Err(StorageFailure::InvalidState(encrypted.UnwrapErr().message));
    }

    const auto& ciphertext = encrypted.Unwrap();
    std::vector<uint8_t> blob;
    blob.reserve(nonce.size() + ciphertext.size());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
    return SealResult::Ok(std::move(blob));
}

Result<std::vector<uint8_t>, StorageFailure> RecordStore::Unseal(
    std::string_view key,
    std::span<const uint8_t> blob) const {
    using UnsealResult = Result<std::vector<uint8_t>, StorageFailure>;

    if (blob.size() < Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return UnsealResult::Err(StorageFailure::TamperOrWrongPassphrase(
            compat::format("{}: record {} is truncated",
                ErrorMessages::TAMPER_OR_WRONG_PASSPHRASE, key)));
    }
    const auto nonce = blob.first(Constants::AES_GCM_NONCE_SIZE);
    const auto ciphertext = blob.subspan(Constants::AES_GCM_NONCE_SIZE);

    auto opened = key_.WithReadAccess([&](std::span<const uint8_t> aes_key) {
        return AesGcm::Decrypt(aes_key, nonce, ciphertext, AsBytes(key));
    });
    if (opened.IsErr()) {
        return UnsealResult::Err(StorageFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    auto& decrypted = opened.Unwrap();
    if (decrypted.IsErr()) {
        return UnsealResult::Err(StorageFailure::TamperOrWrongPassphrase(
            compat::format("{}: record {}", ErrorMessages::TAMPER_OR_WRONG_PASSPHRASE, key)));
    }
    return UnsealResult::Ok(std::move(decrypted).Unwrap());
}

// ============================================================================
// Sealed values
// ============================================================================

Result<std::optional<proto::storage::StoredValue>, StorageFailure> RecordStore::Get(std::string_view key) {
    using GetResult = Result<std::optional<proto::storage::StoredValue>, StorageFailure>;

    std::lock_guard lock(mutex_);
    auto row = ReadBlob(*db_, "SELECT value FROM kv WHERE key = ?1", key);
    if (row.IsErr()) {
        return GetResult::Err(row.UnwrapErr());
    }
    const auto& blob = row.Unwrap();
    if (!blob.has_value()) {
        return GetResult::Ok(std::nullopt);
    }

    auto plaintext = Unseal(key, *blob);
    if (plaintext.IsErr()) {
        return GetResult::Err(plaintext.UnwrapErr());
    }
    auto& bytes = plaintext.Unwrap();
    proto::storage::StoredValue value;
    const bool parsed = value.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
    if (!parsed) {
        return GetResult::Err(StorageFailure::Decode(
            compat::format("Record {} is not a valid stored value", key)));
    }
    return GetResult::Ok(std::move(value));
}

Result<Unit, StorageFailure> RecordStore::Set(std::string_view key, const proto::storage::StoredValue& value) {
    std::string serialized;
    if (!value.SerializeToString(&serialized)) {
        return Result<Unit, StorageFailure>::Err(
            StorageFailure::Decode(compat::format("Failed to serialize record {}", key)));
    }

    std::lock_guard lock(mutex_);
    auto blob = Seal(key, AsBytes(serialized));
    (void)SodiumInterop::SecureWipe(
        std::span<uint8_t>(reinterpret_cast<uint8_t*>(serialized.data()), serialized.size()));
    if (blob.IsErr()) {
        return Result<Unit, StorageFailure>::Err(blob.UnwrapErr());
    }
    return WriteBlob(*db_, "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2)", key, blob.Unwrap());
}

Result<Unit, StorageFailure> RecordStore::Delete(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto stmt_result = db_->Prepare("DELETE FROM kv WHERE key = ?1");
    if (stmt_result.IsErr()) {
        return Result<Unit, StorageFailure>::Err(stmt_result.UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    COURIER_TRY_UNIT(stmt.BindText(1, key));
    return stmt.Run();
}

Result<std::vector<std::string>, StorageFailure> RecordStore::ListKeysByPrefix(std::string_view prefix) {
    using ListResult = Result<std::vector<std::string>, StorageFailure>;

    std::lock_guard lock(mutex_);
    // substr/length compare avoids LIKE wildcards in the prefix.
    auto stmt_result = db_->Prepare(
        "SELECT key FROM kv WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key");
    if (stmt_result.IsErr()) {
        return ListResult::Err(stmt_result.UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    if (auto bound = stmt.BindText(1, prefix); bound.IsErr()) {
        return ListResult::Err(bound.UnwrapErr());
    }

    std::vector<std::string> keys;
    while (true) {
        auto row = stmt.Step();
        if (row.IsErr()) {
            return ListResult::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            break;
        }
        keys.push_back(stmt.ColumnText(0));
    }
    return ListResult::Ok(std::move(keys));
}

// ============================================================================
// Typed accessors
// ============================================================================

Result<std::optional<std::vector<uint8_t>>, StorageFailure> RecordStore::GetBytes(std::string_view key) {
    using BytesResult = Result<std::optional<std::vector<uint8_t>>, StorageFailure>;
    auto value = Get(key);
    if (value.IsErr()) {
        return BytesResult::Err(value.UnwrapErr());
    }
    const auto& stored = value.Unwrap();
    if (!stored.has_value()) {
        return BytesResult::Ok(std::nullopt);
    }
    if (!stored->has_bytes_value()) {
        return BytesResult::Err(WrongArm(key, "bytes"));
    }
    const auto& bytes = stored->bytes_value();
    return BytesResult::Ok(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

Result<Unit, StorageFailure> RecordStore::SetBytes(std::string_view key, std::span<const uint8_t> value) {
    proto::storage::StoredValue stored;
    stored.set_bytes_value(value.data(), value.size());
    return Set(key, stored);
}

Result<std::optional<std::string>, StorageFailure> RecordStore::GetText(std::string_view key) {
    using TextResult = Result<std::optional<std::string>, StorageFailure>;
    auto value = Get(key);
    if (value.IsErr()) {
        return TextResult::Err(value.UnwrapErr());
    }
    const auto& stored = value.Unwrap();
    if (!stored.has_value()) {
        return TextResult::Ok(std::nullopt);
    }
    if (!stored->has_text_value()) {
        return TextResult::Err(WrongArm(key, "text"));
    }
    return TextResult::Ok(stored->text_value());
}

Result<Unit, StorageFailure> RecordStore::SetText(std::string_view key, std::string_view value) {
    proto::storage::StoredValue stored;
    stored.set_text_value(std::string(value));
    return Set(key, stored);
}

Result<std::optional<int64_t>, StorageFailure> RecordStore::GetInteger(std::string_view key) {
    using IntegerResult = Result<std::optional<int64_t>, StorageFailure>;
    auto value = Get(key);
    if (value.IsErr()) {
        return IntegerResult::Err(value.UnwrapErr());
    }
    const auto& stored = value.Unwrap();
    if (!stored.has_value()) {
        return IntegerResult::Ok(std::nullopt);
    }
    if (!stored->has_integer_value()) {
        return IntegerResult::Err(WrongArm(key, "an integer"));
    }
    return IntegerResult::Ok(stored->integer_value());
}

Result<Unit, StorageFailure> RecordStore::SetInteger(std::string_view key, const int64_t value) {
    proto::storage::StoredValue stored;
    stored.set_integer_value(value);
    return Set(key, stored);
}

Result<bool, StorageFailure> RecordStore::GetMessage(
    std::string_view key,
    google::protobuf::MessageLite& message) {
    auto bytes = GetBytes(key);
    if (bytes.IsErr()) {
        return Result<bool, StorageFailure>::Err(bytes.UnwrapErr());
    }
    auto& value = bytes.Unwrap();
    if (!value.has_value()) {
        return Result<bool, StorageFailure>::Ok(false);
    }
    const bool parsed = message.ParseFromArray(value->data(), static_cast<int>(value->size()));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(*value));
    if (!parsed) {
        return Result<bool, StorageFailure>::Err(StorageFailure::Decode(
            compat::format("Record {} is not a valid {}", key, message.GetTypeName())));
    }
    return Result<bool, StorageFailure>::Ok(true);
}

Result<Unit, StorageFailure> RecordStore::SetMessage(
    std::string_view key,
    const google::protobuf::MessageLite& message) {
    proto::storage::StoredValue stored;
    if (!message.SerializeToString(stored.mutable_bytes_value())) {
        return Result<Unit, StorageFailure>::Err(StorageFailure::Decode(
            compat::format("Failed to serialize {} for record {}", message.GetTypeName(), key)));
    }
    auto written = Set(key, stored);
    auto* bytes = stored.mutable_bytes_value();
    (void)SodiumInterop::SecureWipe(
        std::span<uint8_t>(reinterpret_cast<uint8_t*>(bytes->data()), bytes->size()));
    return written;
}

// ============================================================================
// Plaintext metadata
// ============================================================================

Result<std::optional<std::string>, StorageFailure> RecordStore::GetMeta(std::string_view key) {
    using MetaResult = Result<std::optional<std::string>, StorageFailure>;
    std::lock_guard lock(mutex_);
    auto blob = ReadMeta(*db_, key);
    if (blob.IsErr()) {
        return MetaResult::Err(blob.UnwrapErr());
    }
    const auto& value = blob.Unwrap();
    if (!value.has_value()) {
        return MetaResult::Ok(std::nullopt);
    }
    return MetaResult::Ok(Encoding::ToText(*value));
}

Result<Unit, StorageFailure> RecordStore::SetMeta(std::string_view key, std::string_view value) {
    std::lock_guard lock(mutex_);
    return WriteMeta(*db_, key, AsBytes(value));
}

}
