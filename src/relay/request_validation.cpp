#include "courier/relay/request_validation.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/envelope_codec.hpp"

namespace courier::relay {

namespace {
    Result<Unit, RelayFailure> Invalid(std::string_view field, std::string_view rule) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::Validation(compat::format("{}: {}", field, rule)));
    }

    Result<Unit, RelayFailure> Ok() {
        return Result<Unit, RelayFailure>::Ok(protocol::unit);
    }

    Result<Unit, RelayFailure> NonEmpty(std::string_view field, const std::string& value) {
        return value.empty() ? Invalid(field, "must not be empty") : Ok();
    }

    Result<Unit, RelayFailure> ValidateSignedEntry(
        std::string_view field,
        const bool present,
        const proto::wire::SignedPreKeyEntry& entry) {
        if (!present) {
            return Invalid(field, "is required");
        }
        if (entry.key_id() < 0) {
            return Invalid(compat::format("{}.keyId", field), "must be a non-negative integer");
        }
        COURIER_TRY_UNIT(NonEmpty(compat::format("{}.publicKey", field), entry.public_key()));
        return NonEmpty(compat::format("{}.signature", field), entry.signature());
    }
}

Result<Unit, RelayFailure> RequestValidation::ValidateRegister(const proto::wire::RegisterRequest& request) {
    return NonEmpty("id", request.id());
}

Result<Unit, RelayFailure> RequestValidation::ValidateBundle(const proto::wire::Bundle& bundle) {
    COURIER_TRY_UNIT(NonEmpty("bundle.id", bundle.id()));
    if (bundle.device_id() <= 0) {
        return Invalid("bundle.deviceId", "must be a positive integer");
    }
    if (bundle.registration_id() <= 0) {
        return Invalid("bundle.registrationId", "must be a positive integer");
    }
    COURIER_TRY_UNIT(NonEmpty("bundle.identityKey", bundle.identity_key()));
    COURIER_TRY_UNIT(ValidateSignedEntry("bundle.signedPreKey", bundle.has_signed_pre_key(), bundle.signed_pre_key()));
    if (!bundle.has_pre_key()) {
        return Invalid("bundle.preKey", "is required");
    }
    if (bundle.pre_key().key_id() < 0) {
        return Invalid("bundle.preKey.keyId", "must be a non-negative integer");
    }
    COURIER_TRY_UNIT(NonEmpty("bundle.preKey.publicKey", bundle.pre_key().public_key()));
    return ValidateSignedEntry("bundle.kyberPreKey", bundle.has_kyber_pre_key(), bundle.kyber_pre_key());
}

Result<Unit, RelayFailure> RequestValidation::ValidateUpload(const proto::wire::PreKeyUpload& upload) {
    COURIER_TRY_UNIT(NonEmpty("id", upload.id()));
    if (!upload.has_bundle()) {
        return Invalid("bundle", "is required");
    }
    return ValidateBundle(upload.bundle());
}

Result<Unit, RelayFailure> RequestValidation::ValidateMessage(const proto::wire::RelayMessage& message) {
    COURIER_TRY_UNIT(NonEmpty("from", message.from()));
    COURIER_TRY_UNIT(NonEmpty("to", message.to()));
    if (!message.has_envelope()) {
        return Invalid("envelope", "is required");
    }
    auto envelope = protocol::utilities::EnvelopeCodec::Validate(message.envelope());
    if (envelope.IsErr()) {
        return Result<Unit, RelayFailure>::Err(RelayFailure::Validation(envelope.UnwrapErr().message));
    }
    return Ok();
}

Result<Unit, RelayFailure> RequestValidation::ValidateMetrics(const proto::wire::HostMetrics& metrics) {
    if (metrics.cpu_pct() < 0) {
        return Invalid("cpuPct", "must be >= 0");
    }
    if (metrics.mem_pct() < 0) {
        return Invalid("memPct", "must be >= 0");
    }
    if (metrics.swap_pct() < 0) {
        return Invalid("swapPct", "must be >= 0");
    }
    if (metrics.net_in_bytes() < 0) {
        return Invalid("netInBytes", "must be >= 0");
    }
    if (metrics.net_out_bytes() < 0) {
        return Invalid("netOutBytes", "must be >= 0");
    }
    if (metrics.load_size() != 3) {
        return Invalid("load", "must hold exactly 3 numbers");
    }
    if (metrics.updated_at() <= 0) {
        return Invalid("updatedAt", "must be a positive integer");
    }
    return Ok();
}

}
