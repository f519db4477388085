#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace pt::util;
namespace fs = std::filesystem;

StagingFile::StagingFile(fs::path target) : target_(std::move(target)) {
    const auto parent = target_.parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    tmp_ = parent / ("." + target_.filename().string() + ".porter-" + generate_random_suffix() + ".part");
}

StagingFile::~StagingFile() {
    if (committed_) return;
    std::error_code ec;
    fs::remove(tmp_, ec);
    if (ec && pt::log::Registry::isInitialized())
        pt::log::Registry::storage()->warn("[StagingFile] Failed to remove {}: {}", tmp_.string(), ec.message());
}

void StagingFile::commit() {
    if (committed_) return;
    if (!fs::exists(tmp_)) throw fs::filesystem_error("staged file is missing", tmp_, std::make_error_code(std::errc::no_such_file_or_directory));
    fs::rename(tmp_, target_);
    committed_ = true;
}
