#include "courier/utilities/encoding.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <sodium.h>
#include <chrono>

namespace courier::protocol::utilities {

namespace {
    constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;
}

std::string Encoding::ToBase64(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), kBase64Variant);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), kBase64Variant);
    // encoded_len counts the trailing NUL
    out.resize(encoded_len - 1);
    return out;
}

Result<std::vector<uint8_t>, ProtocolFailure> Encoding::FromBase64(std::string_view text) {
    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(),
                          text.data(), text.size(),
                          nullptr, &bin_len, &end, kBase64Variant) != SodiumConstants::SUCCESS ||
        end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Invalid base64 input"));
    }
    out.resize(bin_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(out));
}

std::string Encoding::ToHex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.resize(data.size() * 2);
    return out;
}

std::string Encoding::GenerateUuid() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

int64_t Encoding::NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<uint8_t> Encoding::ToBytes(std::string_view text) {
    return {text.begin(), text.end()};
}

std::string Encoding::ToText(std::span<const uint8_t> data) {
    return {data.begin(), data.end()};
}

}
