#pragma once

#include "storage/Strategy.hpp"
#include "storage/CredentialResolver.hpp"
#include "config/Config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pt::storage {

// Strategy instances for one process, selected at configuration time.
// Named strategies come from the `strategies` config list; a locator with
// no named strategy binds to the first configured strategy serving its
// scheme, else to a per-scheme default (file, s3, gs, http, https, ssh).
class Registry {
public:
    explicit Registry(const config::Config& cfg,
                      std::shared_ptr<CredentialResolver> resolver = std::make_shared<EnvCredentialResolver>());

    static std::shared_ptr<Strategy> make(const config::StrategyConfig& cfg,
                                          uintmax_t partSize,
                                          std::shared_ptr<CredentialResolver> resolver);

    // Replaces any strategy with the same name.
    void add(std::shared_ptr<Strategy> strategy);

    // Throws std::out_of_range for an unknown name.
    [[nodiscard]] std::shared_ptr<Strategy> byName(const std::string& name) const;

    // Throws TransferError(SchemeMismatch) when nothing serves the scheme.
    [[nodiscard]] std::shared_ptr<Strategy> forLocator(const transfer::model::Locator& loc) const;

    [[nodiscard]] std::vector<std::string> names() const;

private:
    [[nodiscard]] std::shared_ptr<Strategy> defaultFor(const std::string& scheme) const;

    uintmax_t partSize_;
    std::shared_ptr<CredentialResolver> resolver_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Strategy>> configured_;
    mutable std::map<std::string, std::shared_ptr<Strategy>> defaults_;
};

}
