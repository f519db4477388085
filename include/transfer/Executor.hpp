#pragma once

#include "config/Config.hpp"
#include "transfer/model/TransferSpec.hpp"
#include "transfer/model/TransferResult.hpp"
#include "transfer/model/TaskOutcome.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace pt::transfer {

struct ExecutorOptions {
    unsigned int max_concurrency = 0;   // 0 = one worker per spec in the phase
    config::DuplicatePolicy duplicates = config::DuplicatePolicy::Warn;
    std::optional<std::chrono::milliseconds> default_timeout;

    static ExecutorOptions fromConfig(const config::TransferConfig& cfg);
};

// Runs the specs of one phase concurrently and returns their results in
// declaration order. Returns only after every transfer of the phase has
// finished, successfully or not.
class Executor {
public:
    explicit Executor(ExecutorOptions opts = {});

    [[nodiscard]] std::vector<model::TransferResult>
    runPhase(const std::vector<model::TransferSpec>& specs,
             model::Phase phase,
             const std::shared_ptr<std::atomic<bool>>& interruptFlag = nullptr) const;

    // Specs of `phase` that share a destination, one Diagnostic per destination.
    [[nodiscard]] static std::vector<model::Diagnostic>
    conflicts(const std::vector<model::TransferSpec>& specs, model::Phase phase);

    // Diagnostics for both phases; throws TransferError(AuthorConflict) under
    // the error policy.
    [[nodiscard]] std::vector<model::Diagnostic> checkConflicts(const std::vector<model::TransferSpec>& specs) const;

    [[nodiscard]] const ExecutorOptions& options() const { return opts_; }

private:
    ExecutorOptions opts_;
};

}
