#pragma once

#include "config/Config.hpp"
#include "transfer/Context.hpp"
#include "transfer/model/Direction.hpp"
#include "transfer/model/Locator.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pt::storage {

namespace fs = std::filesystem;

enum class StrategyType { Local, RemoteHost, ObjectStore, Http };

std::string to_string(StrategyType type);
StrategyType strategy_type_from_string(const std::string& str);

// Transfer capability for one storage backend. Implementations are shared by
// every spec bound to them and may run many transfers concurrently, so the
// transfer methods are const and any cached client is initialized through
// concurrency::SharedInit.
//
// download() must leave either a complete file at `local` or nothing at all.
// upload() returns only once the remote side acknowledged the write.
// Both throw transfer::TransferError with the matching ErrorKind.
class Strategy {
public:
    explicit Strategy(config::StrategyConfig cfg);
    virtual ~Strategy() = default;

    [[nodiscard]] virtual StrategyType type() const = 0;

    // Schemes this instance binds to; a configured `scheme` narrows it to one.
    [[nodiscard]] virtual std::vector<std::string> schemes() const = 0;

    [[nodiscard]] virtual bool canUpload() const { return true; }

    [[nodiscard]] virtual bool accepts(const transfer::model::Locator& loc) const;

    // Construction-time check used by TransferSpec: SchemeMismatch,
    // PathUnresolved or UnsupportedOperation.
    void validate(const transfer::model::Locator& loc, transfer::model::Direction direction) const;

    virtual void download(const transfer::model::Locator& remote, const fs::path& local,
                          const transfer::Context& ctx) const = 0;

    virtual void upload(const fs::path& local, const transfer::model::Locator& remote,
                        const transfer::Context& ctx) const = 0;

    [[nodiscard]] const std::string& name() const { return config_.name; }
    [[nodiscard]] const config::StrategyConfig& config() const { return config_; }

protected:
    // Variant-specific locator rules beyond the scheme; throws TransferError.
    virtual void checkLocator(const transfer::model::Locator&) const {}

    config::StrategyConfig config_;
};

}
