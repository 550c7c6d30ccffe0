#pragma once
#include "courier/utilities/encoding.hpp"
#include "courier/utilities/envelope_codec.hpp"
#include "wire/relay.pb.h"
#include <string>

namespace courier::relay::test_helpers {

/// Bundle that passes relay shape checks; the key bytes are placeholders.
inline proto::wire::Bundle SampleBundle(const std::string& id, const int32_t pre_key_id = 1) {
    proto::wire::Bundle bundle;
    bundle.set_id(id);
    bundle.set_device_id(1);
    bundle.set_registration_id(1234);
    bundle.set_identity_key(std::string(32, 'i'));
    auto* signed_pre_key = bundle.mutable_signed_pre_key();
    signed_pre_key->set_key_id(1);
    signed_pre_key->set_public_key(std::string(32, 's'));
    signed_pre_key->set_signature(std::string(64, 'g'));
    auto* pre_key = bundle.mutable_pre_key();
    pre_key->set_key_id(pre_key_id);
    pre_key->set_public_key(std::string(32, 'p'));
    auto* kyber_pre_key = bundle.mutable_kyber_pre_key();
    kyber_pre_key->set_key_id(1);
    kyber_pre_key->set_public_key(std::string(1184, 'k'));
    kyber_pre_key->set_signature(std::string(64, 'g'));
    return bundle;
}

inline proto::wire::PreKeyUpload SampleUpload(const std::string& id, const int32_t pre_key_id = 1) {
    proto::wire::PreKeyUpload upload;
    upload.set_id(id);
    *upload.mutable_bundle() = SampleBundle(id, pre_key_id);
    return upload;
}

/// Relay message whose envelope body is `text` in the clear.
inline proto::wire::RelayMessage SampleMessage(
    const std::string& from,
    const std::string& to,
    const std::string& text) {
    proto::wire::RelayMessage message;
    message.set_from(from);
    message.set_to(to);
    *message.mutable_envelope() = protocol::utilities::EnvelopeCodec::Build(
        from, to, 1, protocol::utilities::Encoding::ToBytes(text),
        protocol::utilities::Encoding::NowMillis());
    return message;
}

}
