#pragma once

#include <map>
#include <string>
#include <vector>

namespace pt::transfer { struct Context; }

namespace pt::util {

struct ProcessOptions {
    std::map<std::string, std::string> extraEnv;
    bool captureStdout = false;
};

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;

    [[nodiscard]] bool ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// fork/execvp argv[0] and wait for it, honoring the context's deadline and
// interrupt flag by killing the child. Throws std::runtime_error only when
// the child cannot be started at all.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const transfer::Context& ctx,
                         const ProcessOptions& opts = {});

// True when `program` resolves to an executable through PATH (or is a path itself).
[[nodiscard]] bool findInPath(const std::string& program);

}
