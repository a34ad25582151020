#pragma once

#include "auth/Crypto.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace psmonitor::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("psmonitor-test-" + auth::crypto::to_hex(auth::crypto::random_bytes(8)))) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace psmonitor::testing
