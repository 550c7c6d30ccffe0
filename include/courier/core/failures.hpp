#pragma once
#include <string>
#include <string_view>
#include <cstdint>
namespace courier::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    PeerPubKey,
    Handshake,
    Decode,
    Encode,
    InvalidState,
    UntrustedIdentity,
    DuplicateMessage,
    MaterialNotFound,
    Storage
};
enum class StorageFailureType {
    Io,
    Sql,
    TamperOrWrongPassphrase,
    Decode,
    MaterialNotFound,
    InvalidState
};
enum class RelayFailureType {
    Validation,
    NotRegistered,
    NotFound,
    Unauthorized,
    Transport,
    Storage
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class StorageFailure {
public:
    StorageFailureType type;
    std::string message;
    StorageFailure(const StorageFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static StorageFailure Io(std::string msg) {
        return {StorageFailureType::Io, std::move(msg)};
    }
    static StorageFailure Sql(std::string msg) {
        return {StorageFailureType::Sql, std::move(msg)};
    }
    static StorageFailure TamperOrWrongPassphrase(std::string msg) {
        return {StorageFailureType::TamperOrWrongPassphrase, std::move(msg)};
    }
    static StorageFailure Decode(std::string msg) {
        return {StorageFailureType::Decode, std::move(msg)};
    }
    static StorageFailure MaterialNotFound(std::string msg) {
        return {StorageFailureType::MaterialNotFound, std::move(msg)};
    }
    static StorageFailure InvalidState(std::string msg) {
        return {StorageFailureType::InvalidState, std::move(msg)};
    }
    static StorageFailure FromSodiumFailure(const SodiumFailure& sf) {
        return InvalidState(sf.message);
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure PeerPubKey(std::string msg) {
        return {ProtocolFailureType::PeerPubKey, std::move(msg)};
    }
    static ProtocolFailure Handshake(std::string msg) {
        return {ProtocolFailureType::Handshake, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure UntrustedIdentity(std::string msg) {
        return {ProtocolFailureType::UntrustedIdentity, std::move(msg)};
    }
    static ProtocolFailure DuplicateMessage(std::string msg) {
        return {ProtocolFailureType::DuplicateMessage, std::move(msg)};
    }
    static ProtocolFailure MaterialNotFound(std::string msg) {
        return {ProtocolFailureType::MaterialNotFound, std::move(msg)};
    }
    static ProtocolFailure Storage(std::string msg) {
        return {ProtocolFailureType::Storage, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    static ProtocolFailure FromStorageFailure(const StorageFailure& sf) {
        if (sf.type == StorageFailureType::MaterialNotFound) {
            return MaterialNotFound(sf.message);
        }
        return Storage(sf.message);
    }
};
class RelayFailure {
public:
    RelayFailureType type;
    std::string message;
    RelayFailure(const RelayFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RelayFailure Validation(std::string msg) {
        return {RelayFailureType::Validation, std::move(msg)};
    }
    static RelayFailure NotRegistered(std::string msg) {
        return {RelayFailureType::NotRegistered, std::move(msg)};
    }
    static RelayFailure NotFound(std::string msg) {
        return {RelayFailureType::NotFound, std::move(msg)};
    }
    static RelayFailure Unauthorized(std::string msg) {
        return {RelayFailureType::Unauthorized, std::move(msg)};
    }
    static RelayFailure Transport(std::string msg) {
        return {RelayFailureType::Transport, std::move(msg)};
    }
    static RelayFailure Storage(std::string msg) {
        return {RelayFailureType::Storage, std::move(msg)};
    }
    static RelayFailure FromStorageFailure(const StorageFailure& sf) {
        return Storage(sf.message);
    }
    [[nodiscard]] uint16_t HttpStatus() const noexcept {
        switch (type) {
            case RelayFailureType::Validation: return 400;
            case RelayFailureType::NotRegistered: return 404;
            case RelayFailureType::NotFound: return 404;
            case RelayFailureType::Unauthorized: return 401;
            case RelayFailureType::Transport: return 502;
            case RelayFailureType::Storage: return 500;
        }
        return 500;
    }
};
}
