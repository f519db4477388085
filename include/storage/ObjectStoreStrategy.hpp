#pragma once

#include "storage/Strategy.hpp"
#include "storage/CredentialResolver.hpp"
#include "concurrency/SharedInit.hpp"

#include <memory>

namespace pt::storage {

// Bucket/key transfers against S3 (`s3://bucket/key`) or GCS in its XML
// interoperability mode (`gs://bucket/key`). Objects larger than the part
// size are downloaded in byte ranges and uploaded as multipart uploads.
class ObjectStoreStrategy final : public Strategy {
public:
    ObjectStoreStrategy(config::StrategyConfig cfg,
                        uintmax_t partSize,
                        std::shared_ptr<CredentialResolver> resolver);

    [[nodiscard]] StrategyType type() const override { return StrategyType::ObjectStore; }
    [[nodiscard]] std::vector<std::string> schemes() const override;

    void download(const transfer::model::Locator& remote, const fs::path& local,
                  const transfer::Context& ctx) const override;

    void upload(const fs::path& local, const transfer::model::Locator& remote,
                const transfer::Context& ctx) const override;

    [[nodiscard]] uintmax_t partSize() const { return partSize_; }

    // Resolved once per instance; failures are rethrown to every waiter.
    [[nodiscard]] std::shared_ptr<ObjectStoreCredentials> credentials() const;

protected:
    void checkLocator(const transfer::model::Locator& loc) const override;

private:
    [[nodiscard]] std::string signingScheme() const;

    uintmax_t partSize_;
    std::shared_ptr<CredentialResolver> resolver_;
    mutable concurrency::SharedInit<ObjectStoreCredentials> credentials_;
};

}
