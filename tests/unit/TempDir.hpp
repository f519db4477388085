#pragma once

#include "util/files.hpp"

#include <filesystem>

namespace pt::test {

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("porter-ut-" + util::generate_random_suffix(10))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

}
