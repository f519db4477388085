#pragma once

#include <filesystem>

namespace pt::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();
std::filesystem::path getWorkRoot();

// Redirects config lookup to a path that does not exist and logs into a
// process-private temp directory.
void setPathsForTesting();

}
