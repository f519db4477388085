#pragma once

#include "storage/Strategy.hpp"
#include "transfer/model/Error.hpp"
#include "concurrency/SharedInit.hpp"
#include "util/process.hpp"

#include <string>
#include <vector>

namespace pt::storage {

// Copies over ssh with `scp` (default) or `rsync -e ssh`, run as a child
// process in batch mode. Downloads land in a staging file next to the target
// and are renamed into place only after the copy exits cleanly.
class RemoteHostStrategy final : public Strategy {
public:
    explicit RemoteHostStrategy(config::StrategyConfig cfg);

    [[nodiscard]] StrategyType type() const override { return StrategyType::RemoteHost; }
    [[nodiscard]] std::vector<std::string> schemes() const override;

    // Also requires the locator's host to match a configured `host`.
    [[nodiscard]] bool accepts(const transfer::model::Locator& loc) const override;

    void download(const transfer::model::Locator& remote, const fs::path& local,
                  const transfer::Context& ctx) const override;

    void upload(const fs::path& local, const transfer::model::Locator& remote,
                const transfer::Context& ctx) const override;

    // argv for copying `from` to `to`; either side may be a "[user@]host:path" operand.
    [[nodiscard]] std::vector<std::string> commandFor(const std::string& from, const std::string& to,
                                                      const transfer::model::Locator& remote) const;

    // "[user@]host:path" for the copy program, filling gaps from the config.
    [[nodiscard]] std::string remoteOperand(const transfer::model::Locator& remote) const;

    // Maps a failed copy onto an ErrorKind using the program's stderr.
    static transfer::model::ErrorKind classify(const util::ProcessResult& result);

protected:
    void checkLocator(const transfer::model::Locator& loc) const override;

private:
    struct Toolchain { std::string program; };

    void run(const std::vector<std::string>& argv, const transfer::model::Locator& remote,
             const transfer::Context& ctx) const;

    [[nodiscard]] std::string sshOptions(const transfer::model::Locator& remote) const;

    mutable concurrency::SharedInit<Toolchain> toolchain_;
};

}
