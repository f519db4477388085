#include "storage/LocalStrategy.hpp"
#include "transfer/model/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <vector>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;

LocalStrategy::LocalStrategy(config::StrategyConfig cfg) : Strategy(std::move(cfg)) {}

pt::config::StrategyConfig LocalStrategy::defaultConfig() {
    config::StrategyConfig cfg;
    cfg.name = "local";
    cfg.type = "local";
    cfg.scheme = "file";
    return cfg;
}

std::vector<std::string> LocalStrategy::schemes() const {
    return {config_.scheme.empty() ? "file" : config_.scheme};
}

void LocalStrategy::checkLocator(const Locator& loc) const {
    if (!loc.isAbsolute())
        throw TransferError(ErrorKind::PathUnresolved,
                            fmt::format("Local strategy needs an absolute path, got '{}'", loc.str()));
}

void LocalStrategy::download(const Locator& remote, const fs::path& local, const Context& ctx) const {
    copyAtomically(remote.localPath(), local, ErrorKind::ObjectNotFound, ctx);
}

void LocalStrategy::upload(const fs::path& local, const Locator& remote, const Context& ctx) const {
    copyAtomically(local, remote.localPath(), ErrorKind::LocalIOFailure, ctx);
}

void LocalStrategy::copyAtomically(const fs::path& from, const fs::path& to,
                                   const ErrorKind missingSource, const Context& ctx) {
    ctx.checkpoint();

    std::error_code ec;
    if (!fs::is_regular_file(from, ec))
        throw TransferError(missingSource, fmt::format("Source file '{}' does not exist", from.string()));

    std::ifstream in(from, std::ios::binary);
    if (!in) throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Failed to open '{}' for reading", from.string()));

    util::StagingFile staged(to);
    {
        std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
        if (!out)
            throw TransferError(ErrorKind::LocalIOFailure,
                                fmt::format("Failed to open '{}' for writing", staged.path().string()));

        std::vector<char> buf(COPY_CHUNK_SIZE);
        while (in) {
            ctx.checkpoint();
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            if (const auto n = in.gcount(); n > 0) out.write(buf.data(), n);
            if (!out) throw TransferError(ErrorKind::LocalIOFailure,
                                          fmt::format("Write failed while copying to '{}'", to.string()));
        }
        if (in.bad()) throw TransferError(ErrorKind::LocalIOFailure,
                                          fmt::format("Read failed while copying '{}'", from.string()));
        out.close();
        if (!out) throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Failed to flush '{}'", to.string()));
    }

    staged.commit();
    Registry::storage()->debug("[LocalStrategy] Copied {} -> {}", from.string(), to.string());
}
