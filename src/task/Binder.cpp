#include "task/Binder.hpp"
#include "task/WorkDir.hpp"
#include "storage/Registry.hpp"
#include "storage/Strategy.hpp"
#include "transfer/model/Error.hpp"
#include "transfer/model/Locator.hpp"
#include "util/uuid.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <fmt/core.h>

using namespace pt::task;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;
namespace fs = std::filesystem;

BinderOptions BinderOptions::fromConfig(const config::Config& cfg) {
    BinderOptions opts;
    opts.work_root = cfg.transfer.work_root;
    opts.keep_work_dirs = cfg.transfer.keep_work_dirs;
    opts.executor = ExecutorOptions::fromConfig(cfg.transfer);
    return opts;
}

Binder::Binder(std::shared_ptr<storage::Registry> registry,
               BinderOptions opts,
               std::shared_ptr<OutcomeReporter> reporter)
    : registry_(std::move(registry)), opts_(std::move(opts)),
      executor_(opts_.executor), reporter_(std::move(reporter)) {
    if (!registry_) throw std::invalid_argument("Binder requires a strategy registry");
}

std::vector<TransferSpec> Binder::resolve(const TaskDefinition& task, const fs::path& workdir) const {
    std::vector<TransferSpec> specs;
    specs.reserve(task.files.size());

    for (size_t i = 0; i < task.files.size(); ++i) {
        const auto& decl = task.files[i];
        const auto id = decl.id.value_or(fmt::format("{}:{}", task.name, i));
        const auto remote = Locator::parse(decl.remote);

        fs::path local = decl.local;
        if (local.empty()) {
            auto base = remote.basename();
            if (base.empty() || base == "/" || base == ".") base = fmt::format("file-{}", i);
            local = workdir / base;
        } else if (local.is_relative()) {
            local = workdir / local;
        }

        auto strategy = decl.strategy;
        if (!strategy && !decl.strategy_name.empty()) {
            try {
                strategy = registry_->byName(decl.strategy_name);
            } catch (const std::out_of_range& e) {
                throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Transfer '{}': {}", id, e.what()));
            }
        }
        if (!strategy) strategy = registry_->forLocator(remote);

        specs.emplace_back(id, decl.direction, remote, local, std::move(strategy),
                           TransferOptions{decl.timeout, decl.skip_on_task_failure});
    }

    return specs;
}

nlohmann::json Binder::filePairs(const std::vector<TransferSpec>& specs) {
    auto pairs = nlohmann::json::array();
    for (const auto& s : specs) {
        const auto [src, dst] = s.pathPair();
        pairs.push_back({src, dst});
    }
    return pairs;
}

TaskOutcome Binder::invoke(const TaskDefinition& task,
                           const TaskArgs& args,
                           const std::shared_ptr<std::atomic<bool>>& interruptFlag) const {
    if (args.kwargs.is_object() && args.kwargs.contains(FILES_PARAM))
        throw std::invalid_argument(fmt::format("Task '{}': keyword argument '{}' is reserved", task.name, FILES_PARAM));

    const WorkDir workdir(opts_.work_root, task.name, opts_.keep_work_dirs);
    const auto specs = resolve(task, workdir.path());
    return invoke(task.name, task.body, specs, args, interruptFlag, workdir.id());
}

TaskOutcome Binder::invoke(const std::string& taskName,
                           const TaskBody& body,
                           const std::vector<TransferSpec>& specs,
                           const TaskArgs& args,
                           const std::shared_ptr<std::atomic<bool>>& interruptFlag,
                           std::string invocationId) const {
    if (!body) throw std::invalid_argument(fmt::format("Task '{}' has no body", taskName));
    if (!args.kwargs.is_object()) throw std::invalid_argument("Task kwargs must be a JSON object");
    if (args.kwargs.contains(FILES_PARAM))
        throw std::invalid_argument(fmt::format("Task '{}': keyword argument '{}' is reserved", taskName, FILES_PARAM));

    TaskOutcome outcome;
    outcome.task_name = taskName;
    outcome.invocation_id = invocationId.empty() ? util::generateUUID() : std::move(invocationId);
    outcome.diagnostics = executor_.checkConflicts(specs);

    const auto cancelled = [&] { return interruptFlag && interruptFlag->load(); };

    if (cancelled()) {
        outcome.failure = TaskFailure{ErrorKind::Cancelled, "Invocation cancelled before staging", std::nullopt};
        return finish(std::move(outcome));
    }

    outcome.pre_transfer_results = executor_.runPhase(specs, Phase::Pre, interruptFlag);

    if (const auto* failed = firstFailure(outcome.pre_transfer_results)) {
        outcome.failure = TaskFailure{failed->error.value_or(ErrorKind::TransportFailure),
                                      fmt::format("Input staging failed: {}", failed->message),
                                      failed->spec_id};
        return finish(std::move(outcome));
    }

    if (cancelled()) {
        outcome.failure = TaskFailure{ErrorKind::Cancelled, "Invocation cancelled before the task body ran", std::nullopt};
        return finish(std::move(outcome));
    }

    auto kwargs = args.kwargs;
    kwargs[FILES_PARAM] = filePairs(specs);

    outcome.body_invoked = true;
    try {
        outcome.value = body(args.args, kwargs);
    } catch (const std::exception& e) {
        Registry::task()->error("[Binder] Task '{}' raised: {}", taskName, e.what());
        outcome.failure = TaskFailure{ErrorKind::TaskBodyFailure, e.what(), std::nullopt};
    } catch (...) {
        Registry::task()->error("[Binder] Task '{}' raised an unknown exception", taskName);
        outcome.failure = TaskFailure{ErrorKind::TaskBodyFailure, "unknown exception", std::nullopt};
    }

    std::vector<TransferSpec> post;
    for (const auto& s : specs) {
        if (s.phase() != Phase::Post) continue;
        if (outcome.failure && s.skipOnTaskFailure()) {
            Registry::transfer()->info("[Binder] Skipping '{}' after task failure", s.id());
            continue;
        }
        post.push_back(s);
    }

    outcome.post_transfer_results = executor_.runPhase(post, Phase::Post, interruptFlag);
    return finish(std::move(outcome));
}

TaskOutcome Binder::finish(TaskOutcome outcome) const {
    if (reporter_) reporter_->report(outcome);
    return outcome;
}
