#include "courier/crypto/sodium_secure_memory_handle.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace courier::protocol::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    using AllocateResult = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return AllocateResult::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return AllocateResult::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed(
            compat::format("{} ({} bytes)", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return AllocateResult::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto allocated = Allocate(data.size());
    if (allocated.IsErr()) {
        return allocated;
    }
    auto handle = std::move(allocated).Unwrap();
    if (auto written = handle.Write(data); written.IsErr()) {
        return std::move(written).PropagateErr<SecureMemoryHandle>();
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
    }
    ptr_ = nullptr;
    size_ = 0;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::CheckAccess(size_t length, std::string_view operation) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (length > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("{}: {} bytes requested, region holds {}", operation, length, size_)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    COURIER_TRY_UNIT(CheckAccess(data.size(), ErrorMessages::DATA_EXCEEDS_BUFFER));
    auto* region = static_cast<uint8_t*>(ptr_);
    if (!data.empty()) {
        std::memcpy(region, data.data(), data.size());
    }
    std::memset(region + data.size(), 0, size_ - data.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// The whole region is copied, so `output` must be at least Size() bytes.
Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return CheckAccess(0, "Read");
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("Output buffer too small: {} bytes provided, region holds {}", output.size(), size_)));
    }
    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (auto access = CheckAccess(size, "ReadBytes"); access.IsErr()) {
        return std::move(access).PropagateErr<std::vector<uint8_t>>();
    }
    const auto* region = static_cast<const uint8_t*>(ptr_);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::vector<uint8_t>(region, region + size));
}

}
