#include "util/process.hpp"
#include "transfer/Context.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace pt::util;
using namespace std::chrono;

namespace {

void drain(const int fd, std::string& out, bool& open) {
    char buf[4096];
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) out.append(buf, static_cast<size_t>(n));
    else if (n == 0 || (errno != EINTR && errno != EAGAIN)) open = false;
}

void terminate(const pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) return;
        usleep(50 * 1000);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

}

ProcessResult pt::util::runProcess(const std::vector<std::string>& argv,
                                   const transfer::Context& ctx,
                                   const ProcessOptions& opts) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    int errPipe[2];
    if (pipe(errPipe) == -1) throw std::runtime_error("Failed to create stderr pipe");

    int outPipe[2] = {-1, -1};
    if (opts.captureStdout && pipe(outPipe) == -1) {
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::runtime_error("Failed to create stdout pipe");
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(errPipe[0]);
        close(errPipe[1]);
        if (opts.captureStdout) { close(outPipe[0]); close(outPipe[1]); }
        throw std::runtime_error(fmt::format("Failed to fork {}", argv.front()));
    }

    if (pid == 0) {
        dup2(errPipe[1], STDERR_FILENO);
        close(errPipe[0]);
        close(errPipe[1]);
        if (opts.captureStdout) {
            dup2(outPipe[1], STDOUT_FILENO);
            close(outPipe[0]);
            close(outPipe[1]);
        }

        for (const auto& [k, v] : opts.extraEnv) setenv(k.c_str(), v.c_str(), 1);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(errPipe[1]);
    if (opts.captureStdout) close(outPipe[1]);

    ProcessResult result;
    bool errOpen = true, outOpen = opts.captureStdout;

    while (errOpen || outOpen) {
        if (ctx.isInterrupted()) { result.cancelled = true; break; }
        if (ctx.isExpired()) { result.timed_out = true; break; }

        pollfd fds[2];
        nfds_t n = 0;
        if (errOpen) fds[n++] = {errPipe[0], POLLIN, 0};
        if (outOpen) fds[n++] = {outPipe[0], POLLIN, 0};

        const int rc = poll(fds, n, 100);
        if (rc < 0 && errno != EINTR) break;
        if (rc <= 0) continue;

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == errPipe[0]) drain(errPipe[0], result.stderr_text, errOpen);
            else drain(outPipe[0], result.stdout_text, outOpen);
        }
    }

    close(errPipe[0]);
    if (opts.captureStdout) close(outPipe[0]);

    if (result.cancelled || result.timed_out) {
        terminate(pid);
        return result;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed for {}", argv.front()));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    return result;
}

bool pt::util::findInPath(const std::string& program) {
    namespace fs = std::filesystem;
    if (program.find('/') != std::string::npos) return access(program.c_str(), X_OK) == 0;

    const char* env = std::getenv("PATH");
    if (!env) return false;

    std::istringstream ss(env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        const auto candidate = fs::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}
