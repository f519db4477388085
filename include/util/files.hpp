#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace pt::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

inline void writeFile(const std::filesystem::path& absPath, const std::string& contents) {
    std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to write file: " + absPath.string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
}

inline std::string generate_random_suffix(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

// Temp file beside a final destination. Writers fill path(), then commit()
// renames it over the target in one step; an uncommitted file is removed on
// destruction so a failed download never leaves a partial destination behind.
class StagingFile {
public:
    explicit StagingFile(std::filesystem::path target);
    ~StagingFile();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return tmp_; }
    [[nodiscard]] const std::filesystem::path& target() const { return target_; }
    [[nodiscard]] bool committed() const { return committed_; }

    void commit();

private:
    std::filesystem::path target_;
    std::filesystem::path tmp_;
    bool committed_ = false;
};

}
