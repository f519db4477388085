#include "storage/Strategy.hpp"
#include "transfer/model/Error.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;

std::string pt::storage::to_string(const StrategyType type) {
    switch (type) {
    case StrategyType::Local: return "local";
    case StrategyType::RemoteHost: return "remote_host";
    case StrategyType::ObjectStore: return "object_store";
    case StrategyType::Http: return "http";
    }
    return "unknown";
}

StrategyType pt::storage::strategy_type_from_string(const std::string& str) {
    if (str == "local") return StrategyType::Local;
    if (str == "remote_host" || str == "ssh") return StrategyType::RemoteHost;
    if (str == "object_store" || str == "s3" || str == "gs") return StrategyType::ObjectStore;
    if (str == "http") return StrategyType::Http;
    throw std::invalid_argument("Unknown strategy type: " + str);
}

Strategy::Strategy(config::StrategyConfig cfg) : config_(std::move(cfg)) {}

bool Strategy::accepts(const Locator& loc) const {
    const auto s = schemes();
    return std::ranges::find(s, loc.scheme) != s.end();
}

void Strategy::validate(const Locator& loc, const Direction direction) const {
    if (!accepts(loc))
        throw TransferError(ErrorKind::SchemeMismatch,
                            fmt::format("Strategy '{}' ({}) cannot serve locator '{}'",
                                        name(), to_string(type()), loc.str()));

    checkLocator(loc);

    if (direction == Direction::ToRemote && !canUpload())
        throw TransferError(ErrorKind::UnsupportedOperation,
                            fmt::format("Strategy '{}' is read-only; cannot upload to '{}'", name(), loc.str()));
}
