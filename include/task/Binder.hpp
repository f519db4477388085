#pragma once

#include "task/TaskDefinition.hpp"
#include "task/OutcomeReporter.hpp"
#include "transfer/Executor.hpp"
#include "transfer/model/TaskOutcome.hpp"
#include "transfer/model/TransferSpec.hpp"
#include "config/Config.hpp"
#include "config/paths.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pt::storage { class Registry; }

namespace pt::task {

struct BinderOptions {
    std::filesystem::path work_root = paths::getWorkRoot();
    bool keep_work_dirs = false;
    transfer::ExecutorOptions executor;

    static BinderOptions fromConfig(const config::Config& cfg);
};

// Wraps one task invocation in its staging phases:
// pre-phase downloads, then the body with `files` injected, then post-phase
// uploads. Construction errors (bad locator, unresolved path, unknown
// strategy, duplicate destinations under the error policy) throw before any
// transfer starts; everything after that is reported on the TaskOutcome.
class Binder {
public:
    Binder(std::shared_ptr<storage::Registry> registry,
           BinderOptions opts,
           std::shared_ptr<OutcomeReporter> reporter = nullptr);

    // Declarations -> specs against `workdir`, in declaration order.
    [[nodiscard]] std::vector<transfer::model::TransferSpec>
    resolve(const TaskDefinition& task, const std::filesystem::path& workdir) const;

    // Runs `task` in a fresh working directory.
    transfer::model::TaskOutcome invoke(const TaskDefinition& task,
                                        const TaskArgs& args = {},
                                        const std::shared_ptr<std::atomic<bool>>& interruptFlag = nullptr) const;

    // Runs `body` around already resolved specs.
    transfer::model::TaskOutcome invoke(const std::string& taskName,
                                        const TaskBody& body,
                                        const std::vector<transfer::model::TransferSpec>& specs,
                                        const TaskArgs& args = {},
                                        const std::shared_ptr<std::atomic<bool>>& interruptFlag = nullptr,
                                        std::string invocationId = {}) const;

    // The `files` value: one [source, destination] pair per spec, declaration order.
    [[nodiscard]] static nlohmann::json filePairs(const std::vector<transfer::model::TransferSpec>& specs);

    [[nodiscard]] const transfer::Executor& executor() const { return executor_; }

private:
    transfer::model::TaskOutcome finish(transfer::model::TaskOutcome outcome) const;

    std::shared_ptr<storage::Registry> registry_;
    BinderOptions opts_;
    transfer::Executor executor_;
    std::shared_ptr<OutcomeReporter> reporter_;
};

}
