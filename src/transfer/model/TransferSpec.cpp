#include "transfer/model/TransferSpec.hpp"
#include "transfer/model/Error.hpp"
#include "storage/Strategy.hpp"

#include <fmt/core.h>

using namespace pt::transfer;
using namespace pt::transfer::model;

TransferSpec::TransferSpec(std::string id,
                           const Direction direction,
                           Locator remote,
                           std::filesystem::path localPath,
                           std::shared_ptr<storage::Strategy> strategy,
                           TransferOptions options)
    : id_(std::move(id)), direction_(direction), remote_(std::move(remote)),
      local_(std::move(localPath)), strategy_(std::move(strategy)), options_(std::move(options)) {
    if (id_.empty()) throw std::invalid_argument("TransferSpec requires a non-empty id");

    if (local_.empty() || !local_.is_absolute())
        throw TransferError(ErrorKind::PathUnresolved,
                            fmt::format("Transfer '{}': local path '{}' is not absolute", id_, local_.string()));
    local_ = local_.lexically_normal();

    if (!strategy_)
        throw TransferError(ErrorKind::SchemeMismatch,
                            fmt::format("Transfer '{}': no strategy bound for '{}'", id_, remote_.str()));

    strategy_->validate(remote_, direction_);
}

std::pair<std::string, std::string> TransferSpec::pathPair() const {
    if (direction_ == Direction::ToLocal) return {remote_.str(), local_.string()};
    return {local_.string(), remote_.str()};
}

std::string TransferSpec::destination() const {
    return direction_ == Direction::ToLocal ? local_.string() : remote_.str();
}
