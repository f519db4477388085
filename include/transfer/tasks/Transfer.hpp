#pragma once

#include "concurrency/Task.hpp"
#include "transfer/model/TransferSpec.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>

namespace pt::transfer::tasks {

// Runs one TransferSpec on a pool worker. The promise always receives a
// TransferResult, never an exception. When `predecessor` is set (an earlier
// spec with the same destination) the transfer starts after it finishes.
struct Transfer final : concurrency::PromisedTask {
    model::TransferSpec spec;
    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::optional<std::chrono::milliseconds> defaultTimeout;
    std::optional<std::shared_future<ExpectedFuture>> predecessor;

    Transfer(model::TransferSpec s,
             std::shared_ptr<std::atomic<bool>> flag,
             std::optional<std::chrono::milliseconds> fallbackTimeout = std::nullopt,
             std::optional<std::shared_future<ExpectedFuture>> after = std::nullopt);

    void operator()() override;
};

}
