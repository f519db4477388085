#include "storage/Registry.hpp"
#include "storage/LocalStrategy.hpp"
#include "storage/RemoteHostStrategy.hpp"
#include "storage/ObjectStoreStrategy.hpp"
#include "storage/HttpStrategy.hpp"
#include "transfer/model/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;

Registry::Registry(const config::Config& cfg, std::shared_ptr<CredentialResolver> resolver)
    : partSize_(cfg.transfer.part_size_bytes), resolver_(std::move(resolver)) {
    for (const auto& s : cfg.strategies) add(make(s, partSize_, resolver_));
}

std::shared_ptr<Strategy> Registry::make(const config::StrategyConfig& cfg,
                                         const uintmax_t partSize,
                                         std::shared_ptr<CredentialResolver> resolver) {
    switch (strategy_type_from_string(cfg.type)) {
    case StrategyType::Local: return std::make_shared<LocalStrategy>(cfg);
    case StrategyType::RemoteHost: return std::make_shared<RemoteHostStrategy>(cfg);
    case StrategyType::ObjectStore: return std::make_shared<ObjectStoreStrategy>(cfg, partSize, std::move(resolver));
    case StrategyType::Http: return std::make_shared<HttpStrategy>(cfg);
    }
    throw std::invalid_argument("Unhandled strategy type: " + cfg.type);
}

void Registry::add(std::shared_ptr<Strategy> strategy) {
    if (!strategy) throw std::invalid_argument("Registry::add: null strategy");
    std::scoped_lock lock(mutex_);
    std::erase_if(configured_, [&](const auto& s) { return s->name() == strategy->name(); });
    pt::log::Registry::storage()->debug("[Registry] Registered strategy '{}' ({})", strategy->name(), to_string(strategy->type()));
    configured_.push_back(std::move(strategy));
}

std::shared_ptr<Strategy> Registry::byName(const std::string& name) const {
    std::scoped_lock lock(mutex_);
    const auto it = std::ranges::find_if(configured_, [&](const auto& s) { return s->name() == name; });
    if (it == configured_.end()) throw std::out_of_range(fmt::format("No strategy named '{}'", name));
    return *it;
}

std::shared_ptr<Strategy> Registry::forLocator(const Locator& loc) const {
    {
        std::scoped_lock lock(mutex_);
        for (const auto& s : configured_)
            if (s->accepts(loc)) return s;
    }
    return defaultFor(loc.scheme);
}

std::vector<std::string> Registry::names() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(configured_.size());
    for (const auto& s : configured_) out.push_back(s->name());
    return out;
}

std::shared_ptr<Strategy> Registry::defaultFor(const std::string& scheme) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = defaults_.find(scheme); it != defaults_.end()) return it->second;

    config::StrategyConfig cfg;
    cfg.scheme = scheme;
    cfg.name = "default-" + scheme;

    if (scheme == "file") cfg.type = "local";
    else if (scheme == "s3" || scheme == "gs") cfg.type = "object_store";
    else if (scheme == "http" || scheme == "https") cfg.type = "http";
    else if (scheme == "ssh") cfg.type = "remote_host";
    else throw TransferError(ErrorKind::SchemeMismatch, fmt::format("No storage strategy for scheme '{}'", scheme));

    auto strategy = make(cfg, partSize_, resolver_);
    defaults_.emplace(scheme, strategy);
    return strategy;
}
