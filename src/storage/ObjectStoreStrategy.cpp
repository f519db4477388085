#include "storage/ObjectStoreStrategy.hpp"
#include "storage/s3/S3Controller.hpp"
#include "transfer/model/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::cloud;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;

ObjectStoreStrategy::ObjectStoreStrategy(config::StrategyConfig cfg,
                                         const uintmax_t partSize,
                                         std::shared_ptr<CredentialResolver> resolver)
    : Strategy(std::move(cfg)),
      partSize_(std::max(partSize, config::MIN_PART_SIZE_BYTES)),
      resolver_(resolver ? std::move(resolver) : std::make_shared<EnvCredentialResolver>()),
      credentials_([this] {
          auto creds = std::make_shared<ObjectStoreCredentials>(
              resolveObjectStoreCredentials(config_, signingScheme(), *resolver_));
          Registry::cloud()->info("[ObjectStoreStrategy] '{}' bound to {} (region {})",
                                  name(), creds->endpoint, creds->region);
          return creds;
      }) {}

std::vector<std::string> ObjectStoreStrategy::schemes() const {
    return {config_.scheme.empty() ? "s3" : config_.scheme};
}

std::string ObjectStoreStrategy::signingScheme() const {
    return config_.scheme == "gs" ? "gs" : "s3";
}

std::shared_ptr<ObjectStoreCredentials> ObjectStoreStrategy::credentials() const {
    return credentials_.get();
}

void ObjectStoreStrategy::checkLocator(const Locator& loc) const {
    if (loc.bucket().empty() || loc.key().empty())
        throw TransferError(ErrorKind::SchemeMismatch,
                            fmt::format("Object store locator needs a bucket and a key: '{}'", loc.str()));
}

void ObjectStoreStrategy::download(const Locator& remote, const fs::path& local, const Context& ctx) const {
    const S3Controller s3(*credentials(), remote.bucket());
    const fs::path key = remote.key();

    const auto head = s3.headObject(key, ctx);
    if (!head) throw TransferError(ErrorKind::ObjectNotFound, fmt::format("Object '{}' does not exist", remote.str()));

    util::StagingFile staged(local);
    {
        std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
        if (!out) throw TransferError(ErrorKind::LocalIOFailure,
                                      fmt::format("Failed to open '{}' for writing", staged.path().string()));

        if (head->size > partSize_) {
            for (uintmax_t first = 0; first < head->size; first += partSize_) {
                const auto last = std::min(first + partSize_, head->size) - 1;
                s3.downloadRange(key, out, first, last, ctx);
            }
        } else {
            s3.downloadObject(key, out, ctx);
        }

        out.close();
        if (!out) throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Failed to flush '{}'", local.string()));
    }

    const auto written = fs::file_size(staged.path());
    if (written != head->size)
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("Short read from '{}': got {} of {} bytes", remote.str(), written, head->size));

    staged.commit();
    Registry::cloud()->info("[ObjectStoreStrategy] {} -> {} ({} bytes)", remote.str(), local.string(), written);
}

void ObjectStoreStrategy::upload(const fs::path& local, const Locator& remote, const Context& ctx) const {
    std::error_code ec;
    if (!fs::is_regular_file(local, ec))
        throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Upload source '{}' does not exist", local.string()));

    const S3Controller s3(*credentials(), remote.bucket());
    const fs::path key = remote.key();
    const auto size = fs::file_size(local);

    const auto etag = size > partSize_
        ? s3.uploadLargeObject(key, local, partSize_, ctx)
        : s3.uploadObject(key, local, ctx);

    Registry::cloud()->info("[ObjectStoreStrategy] {} -> {} ({} bytes, etag {})", local.string(), remote.str(), size, etag);
}
