#pragma once

#include <filesystem>
#include <string>

namespace pt::task {

// Invocation-scoped directory `<root>/<task>-<uuid>`; removed on destruction
// unless kept.
class WorkDir {
public:
    WorkDir(const std::filesystem::path& root, const std::string& taskName, bool keep = false);
    ~WorkDir();

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] const std::string& id() const { return id_; }

private:
    std::string id_;
    std::filesystem::path path_;
    bool keep_;
};

}
