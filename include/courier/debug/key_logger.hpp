#pragma once

/**
 * @file key_logger.hpp
 * @brief Trace output of key material and handshake values.
 *
 * SECURITY WARNING: with COURIER_DEBUG_KEYS defined this prints secret keys
 * to stderr. It exists to compare derivations between two peers while
 * debugging. NEVER enable in production builds.
 *
 * Enable via CMake: -DCOURIER_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace courier::debug {

// ============================================================================
// Side identifiers - always defined so types are available
// ============================================================================

enum class Side {
    Initiator,
    Responder,
    Local
};

#ifdef COURIER_DEBUG_KEYS

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(shown * 2);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        default: return "LOCAL";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define COURIER_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stderr, "[COURIER-DEBUG] %s %s %s: %s\n", \
            ::courier::debug::SideToString(side), \
            operation, \
            key_name, \
            ::courier::debug::ToHexTruncated(data).c_str()); \
    } while(0)

#define COURIER_LOG_KEY_IDX(side, operation, key_name, index, data) \
    do { \
        fprintf(stderr, "[COURIER-DEBUG] %s %s %s[%u]: %s\n", \
            ::courier::debug::SideToString(side), \
            operation, \
            key_name, \
            static_cast<uint32_t>(index), \
            ::courier::debug::ToHexTruncated(data).c_str()); \
    } while(0)

#define COURIER_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stderr, "[COURIER-DEBUG] %s ========== %s ==========\n", \
            ::courier::debug::SideToString(side), \
            section_name); \
    } while(0)

// ============================================================================
// Handshake
// ============================================================================

inline void LogX3dhDh(Side side, int dh_number, std::span<const uint8_t> result) {
    char key_name[16];
    snprintf(key_name, sizeof(key_name), "dh%d", dh_number);
    COURIER_LOG_KEY(side, "X3DH", key_name, result);
}

inline void LogHybridCombination(
    Side side,
    std::span<const uint8_t> classical_shared,
    std::span<const uint8_t> kyber_shared,
    std::span<const uint8_t> root_key) {

    COURIER_LOG_KEY(side, "HYBRID", "classical_shared", classical_shared);
    COURIER_LOG_KEY(side, "HYBRID", "kyber_shared", kyber_shared);
    COURIER_LOG_KEY(side, "HYBRID", "root_key", root_key);
}

// ============================================================================
// Message chains
// ============================================================================

inline void LogChainStep(
    Side side,
    const char* chain_type,
    uint32_t index,
    std::span<const uint8_t> message_key) {

    COURIER_LOG_KEY_IDX(side, chain_type, "message_key", index, message_key);
}

#else // !COURIER_DEBUG_KEYS

#define COURIER_LOG_KEY(side, operation, key_name, data) ((void)0)
#define COURIER_LOG_KEY_IDX(side, operation, key_name, index, data) ((void)0)
#define COURIER_LOG_SECTION(side, section_name) ((void)0)

inline void LogX3dhDh(Side, int, std::span<const uint8_t>) {}
inline void LogHybridCombination(Side, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogChainStep(Side, const char*, uint32_t, std::span<const uint8_t>) {}

#endif // COURIER_DEBUG_KEYS

} // namespace courier::debug
