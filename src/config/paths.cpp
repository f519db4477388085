#include "config/paths.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace pt::paths {

namespace {
bool testMode = false;

std::filesystem::path testRoot() {
    return std::filesystem::temp_directory_path() / ("porter-test-" + std::to_string(::getpid()));
}

std::filesystem::path fromEnvOr(const char* var, const std::filesystem::path& fallback) {
    if (const char* v = std::getenv(var); v && *v) return v;
    return fallback;
}
}

std::filesystem::path getConfigPath() {
    if (testMode) return testRoot() / "config.yaml";
    return fromEnvOr("PORTER_CONFIG", "/etc/porter/config.yaml");
}

std::filesystem::path getLogPath() {
    if (testMode) return testRoot() / "log";
    return fromEnvOr("PORTER_LOG_DIR", "/var/log/porter");
}

std::filesystem::path getWorkRoot() {
    if (testMode) return testRoot() / "work";
    return fromEnvOr("PORTER_WORK_ROOT", std::filesystem::temp_directory_path() / "porter");
}

void setPathsForTesting() { testMode = true; }

}
