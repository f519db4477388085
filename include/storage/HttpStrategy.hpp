#pragma once

#include "storage/Strategy.hpp"
#include "concurrency/SharedInit.hpp"

namespace pt::storage {

// Plain http(s) GET. Uploads (PUT to a pre-signed URL) are only allowed when
// the strategy is configured with upload_enabled.
class HttpStrategy final : public Strategy {
public:
    explicit HttpStrategy(config::StrategyConfig cfg);

    [[nodiscard]] StrategyType type() const override { return StrategyType::Http; }
    [[nodiscard]] std::vector<std::string> schemes() const override;
    [[nodiscard]] bool canUpload() const override { return config_.upload_enabled; }

    void download(const transfer::model::Locator& remote, const fs::path& local,
                  const transfer::Context& ctx) const override;

    void upload(const fs::path& local, const transfer::model::Locator& remote,
                const transfer::Context& ctx) const override;

protected:
    void checkLocator(const transfer::model::Locator& loc) const override;

private:
    struct Transport { bool tls; };

    mutable concurrency::SharedInit<Transport> transport_;
};

}
