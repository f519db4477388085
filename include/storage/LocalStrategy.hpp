#pragma once

#include "storage/Strategy.hpp"
#include "transfer/model/Error.hpp"

namespace pt::storage {

// Filesystem copy between two local (or mounted) paths. Both directions
// write through a StagingFile, so either side ends up whole or untouched.
class LocalStrategy final : public Strategy {
public:
    static constexpr size_t COPY_CHUNK_SIZE = 1024 * 1024;

    explicit LocalStrategy(config::StrategyConfig cfg = defaultConfig());

    [[nodiscard]] StrategyType type() const override { return StrategyType::Local; }
    [[nodiscard]] std::vector<std::string> schemes() const override;

    void download(const transfer::model::Locator& remote, const fs::path& local,
                  const transfer::Context& ctx) const override;

    void upload(const fs::path& local, const transfer::model::Locator& remote,
                const transfer::Context& ctx) const override;

    static config::StrategyConfig defaultConfig();

protected:
    void checkLocator(const transfer::model::Locator& loc) const override;

private:
    static void copyAtomically(const fs::path& from, const fs::path& to,
                               transfer::model::ErrorKind missingSource, const transfer::Context& ctx);
};

}
