#pragma once
#include "courier/configuration/store_config.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/utilities/encoding.hpp"
#include <filesystem>
#include <string>
#include <system_error>

namespace courier::protocol::test_helpers {

/// Scrypt cost low enough for tests that open many stores.
inline configuration::StoreConfig FastStoreConfig() {
    return configuration::StoreConfig::Default().WithScryptCost(1024, 8, 1);
}

/// Unique directory under the system temp dir, removed with its contents on destruction.
class TempDirectory {
public:
    TempDirectory()
        : path_(std::filesystem::temp_directory_path() /
                ("courier-test-" + utilities::Encoding::GenerateUuid())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] std::string File(const std::string& name) const {
        return (path_ / name).string();
    }

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
