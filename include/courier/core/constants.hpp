#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace courier::protocol {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_KEY_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr uint32_t DEFAULT_DEVICE_ID = 1;
    static constexpr uint32_t MIN_REGISTRATION_ID = 1;
    static constexpr uint32_t REGISTRATION_ID_UPPER_BOUND = 16380;
    static constexpr uint32_t ENVELOPE_VERSION = 1;
    static constexpr uint32_t APPLICATION_MESSAGE_VERSION = 1;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
    static constexpr uint8_t SECURE_WIPE_PATTERN = 0;
};
struct ScryptConstants {
    static constexpr uint64_t DEFAULT_N = 16384;
    static constexpr uint32_t DEFAULT_R = 8;
    static constexpr uint32_t DEFAULT_P = 1;
    static constexpr size_t KEY_LENGTH = 32;
    static constexpr size_t SALT_LENGTH = 16;
};
struct StoreKeys {
    static constexpr std::string_view META_KDF = "kdf";
    static constexpr std::string_view META_LOCAL_ID = "localId";
    static constexpr std::string_view META_DEVICE_ID = "deviceId";
    static constexpr std::string_view META_REGISTRATION_ID = "registrationId";
    static constexpr std::string_view IDENTITY_KEY_PAIR = "local:identityKeyPair";
    static constexpr std::string_view COUNTER_PRE_KEY = "counter:prekey";
    static constexpr std::string_view COUNTER_SIGNED_PRE_KEY = "counter:signedprekey";
    static constexpr std::string_view COUNTER_KYBER_PRE_KEY = "counter:kyberprekey";
    static constexpr std::string_view IDENTITY_PREFIX = "identity:";
    static constexpr std::string_view SESSION_PREFIX = "session:";
    static constexpr std::string_view PRE_KEY_PREFIX = "prekey:";
    static constexpr std::string_view PRE_KEY_USED_PREFIX = "prekey:used:";
    static constexpr std::string_view SIGNED_PRE_KEY_PREFIX = "signedprekey:";
    static constexpr std::string_view KYBER_PRE_KEY_PREFIX = "kyberprekey:";
    static constexpr std::string_view KYBER_PRE_KEY_USED_PREFIX = "kyberprekey:used:";
    static constexpr std::string_view INBOX_PREFIX = "inbox:";
    static constexpr uint32_t COUNTER_START = 1;
};
struct RelayConstants {
    static constexpr uint16_t DEFAULT_PORT = 8080;
    static constexpr std::string_view DEFAULT_HOST = "0.0.0.0";
    static constexpr std::string_view DEFAULT_DB_PATH = "data/relay.db";
    static constexpr size_t DEFAULT_WORKERS = 4;
    static constexpr uint32_t DEFAULT_PUSH_TIMEOUT_MS = 10000;
    static constexpr uint16_t CLOSE_CODE_SUPERSEDED = 4000;
    static constexpr std::string_view CLOSE_REASON_SUPERSEDED = "superseded";
    static constexpr std::string_view HEALTH_BODY = "ok";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view BUFFER_TOO_SMALL = "Buffer too small";
    static constexpr std::string_view BUFFER_TOO_LARGE = "Buffer too large";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SIGNED_PRE_KEY_FAILED = "Signed pre-key signature verification failed";
    static constexpr std::string_view KYBER_PRE_KEY_FAILED = "Kyber pre-key signature verification failed";
    static constexpr std::string_view IDENTITY_NOT_INITIALIZED = "Local identity not set. Run 'courier init'.";
    static constexpr std::string_view TAMPER_OR_WRONG_PASSPHRASE =
        "Record authentication failed (wrong passphrase or tampered data)";
    static constexpr std::string_view INVALID_JSON_BODY = "Invalid JSON body.";
    static constexpr std::string_view INVALID_REQUEST = "Invalid request.";
    static constexpr std::string_view USER_NOT_REGISTERED = "User not registered.";
    static constexpr std::string_view PREKEYS_NOT_FOUND = "Prekeys not found.";
    static constexpr std::string_view RECIPIENT_NOT_REGISTERED = "Recipient not registered.";
    static constexpr std::string_view NOT_FOUND = "Not found.";
    static constexpr std::string_view INTERNAL_ERROR = "Internal server error.";
    static constexpr std::string_view MISSING_CLIENT_ID = "Missing client_id.";
    static constexpr std::string_view CLIENT_NOT_REGISTERED = "Client not registered.";
};
}
