#include "task/WorkDir.hpp"
#include "util/uuid.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>

using namespace pt::task;
using namespace pt::log;
namespace fs = std::filesystem;

namespace {

std::string sanitize(std::string name) {
    std::ranges::replace_if(name, [](const unsigned char c) {
        return !std::isalnum(c) && c != '-' && c != '_' && c != '.';
    }, '_');
    return name.empty() ? "task" : name;
}

}

WorkDir::WorkDir(const fs::path& root, const std::string& taskName, const bool keep)
    : id_(pt::util::generateUUID()), keep_(keep) {
    path_ = fs::absolute(root) / (sanitize(taskName) + "-" + id_);
    fs::create_directories(path_);
    Registry::task()->debug("[WorkDir] Created {}", path_.string());
}

WorkDir::~WorkDir() {
    if (keep_) {
        Registry::task()->info("[WorkDir] Keeping {}", path_.string());
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) Registry::task()->warn("[WorkDir] Failed to remove {}: {}", path_.string(), ec.message());
}
