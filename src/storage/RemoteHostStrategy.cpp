#include "storage/RemoteHostStrategy.hpp"
#include "transfer/model/Error.hpp"
#include "util/files.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::util;
using namespace pt::log;

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

}

RemoteHostStrategy::RemoteHostStrategy(config::StrategyConfig cfg)
    : Strategy(std::move(cfg)),
      toolchain_([this] {
          if (config_.program != "scp" && config_.program != "rsync")
              throw TransferError(ErrorKind::UnsupportedOperation,
                                  fmt::format("Unsupported copy program '{}' (expected scp or rsync)", config_.program));
          if (!findInPath(config_.program))
              throw TransferError(ErrorKind::TransportFailure,
                                  fmt::format("Copy program '{}' not found in PATH", config_.program));
          if (config_.program == "rsync" && !findInPath("ssh"))
              throw TransferError(ErrorKind::TransportFailure, "ssh not found in PATH");
          if (!config_.credentials_path.empty() && !fs::exists(config_.credentials_path))
              throw TransferError(ErrorKind::AuthenticationFailure,
                                  fmt::format("Identity file '{}' does not exist", config_.credentials_path));
          return std::make_shared<Toolchain>(Toolchain{config_.program});
      }) {}

std::vector<std::string> RemoteHostStrategy::schemes() const {
    return {config_.scheme.empty() ? "ssh" : config_.scheme};
}

bool RemoteHostStrategy::accepts(const Locator& loc) const {
    if (!Strategy::accepts(loc)) return false;
    return config_.host.empty() || loc.host.empty() || loc.host == config_.host;
}

void RemoteHostStrategy::checkLocator(const Locator& loc) const {
    if (loc.host.empty() && config_.host.empty())
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Remote host locator has no host: '{}'", loc.str()));
    if (loc.path.empty() || loc.path == "/")
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Remote host locator has no file path: '{}'", loc.str()));
}

std::string RemoteHostStrategy::remoteOperand(const Locator& remote) const {
    const auto& user = remote.user.empty() ? config_.user : remote.user;
    const auto& host = remote.host.empty() ? config_.host : remote.host;
    return fmt::format("{}{}:{}", user.empty() ? "" : user + "@", host, remote.path);
}

std::string RemoteHostStrategy::sshOptions(const Locator& remote) const {
    std::string opts = fmt::format("ssh -o BatchMode=yes -o ConnectTimeout={}", config_.connect_timeout_seconds);
    if (const auto port = remote.port ? remote.port : config_.port) opts += fmt::format(" -p {}", *port);
    if (!config_.credentials_path.empty()) opts += fmt::format(" -i {}", config_.credentials_path);
    return opts;
}

std::vector<std::string> RemoteHostStrategy::commandFor(const std::string& from, const std::string& to,
                                                        const Locator& remote) const {
    std::vector<std::string> argv;

    if (config_.program == "rsync") {
        argv = {"rsync", "-q", "-e", sshOptions(remote)};
    } else {
        argv = {"scp", "-B", "-q",
                "-o", "BatchMode=yes",
                "-o", fmt::format("ConnectTimeout={}", config_.connect_timeout_seconds)};
        if (const auto port = remote.port ? remote.port : config_.port) {
            argv.emplace_back("-P");
            argv.push_back(std::to_string(*port));
        }
        if (!config_.credentials_path.empty()) {
            argv.emplace_back("-i");
            argv.push_back(config_.credentials_path);
        }
    }

    argv.push_back(from);
    argv.push_back(to);
    return argv;
}

ErrorKind RemoteHostStrategy::classify(const ProcessResult& result) {
    if (result.cancelled) return ErrorKind::Cancelled;
    if (result.timed_out) return ErrorKind::NetworkTimeout;

    const auto& err = result.stderr_text;
    if (contains(err, "Permission denied") || contains(err, "Host key verification failed") ||
        contains(err, "Authentication failed") || contains(err, "Too many authentication failures"))
        return ErrorKind::AuthenticationFailure;
    if (contains(err, "No such file or directory") || contains(err, "not a regular file") ||
        contains(err, "change_dir"))
        return ErrorKind::ObjectNotFound;
    if (contains(err, "timed out") || contains(err, "Connection timed out"))
        return ErrorKind::NetworkTimeout;
    return ErrorKind::TransportFailure;
}

void RemoteHostStrategy::run(const std::vector<std::string>& argv, const Locator& remote, const Context& ctx) const {
    ctx.checkpoint();
    toolchain_.get();

    Registry::ssh()->debug("[RemoteHostStrategy] {}", fmt::join(argv, " "));

    const auto result = runProcess(argv, ctx);
    if (result.ok()) return;

    auto stderrText = result.stderr_text;
    trimInPlace(stderrText);
    const auto kind = classify(result);

    Registry::ssh()->error("[RemoteHostStrategy] {} failed for {} (exit {}): {}",
                           argv.front(), remote.str(), result.exit_code, stderrText);
    throw TransferError(kind, fmt::format("{} {} failed (exit {}): {}", argv.front(), remote.str(),
                                          result.exit_code, stderrText.empty() ? to_string(kind) : stderrText));
}

void RemoteHostStrategy::download(const Locator& remote, const fs::path& local, const Context& ctx) const {
    StagingFile staged(local);
    run(commandFor(remoteOperand(remote), staged.path().string(), remote), remote, ctx);

    if (!fs::is_regular_file(staged.path()))
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("{} exited cleanly but produced no file for {}", config_.program, remote.str()));

    staged.commit();
    Registry::ssh()->info("[RemoteHostStrategy] {} -> {}", remote.str(), local.string());
}

void RemoteHostStrategy::upload(const fs::path& local, const Locator& remote, const Context& ctx) const {
    std::error_code ec;
    if (!fs::is_regular_file(local, ec))
        throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Upload source '{}' does not exist", local.string()));

    run(commandFor(local.string(), remoteOperand(remote), remote), remote, ctx);
    Registry::ssh()->info("[RemoteHostStrategy] {} -> {}", local.string(), remote.str());
}
