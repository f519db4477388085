#include "transfer/Executor.hpp"
#include "transfer/tasks/Transfer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <map>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::concurrency;
using namespace pt::log;
using namespace std::chrono;

ExecutorOptions ExecutorOptions::fromConfig(const config::TransferConfig& cfg) {
    ExecutorOptions opts;
    opts.max_concurrency = cfg.max_concurrency;
    opts.duplicates = cfg.duplicate_destinations;
    if (cfg.default_timeout_seconds > 0) opts.default_timeout = seconds(cfg.default_timeout_seconds);
    return opts;
}

Executor::Executor(ExecutorOptions opts) : opts_(std::move(opts)) {}

std::vector<TransferResult> Executor::runPhase(const std::vector<TransferSpec>& specs,
                                               const Phase phase,
                                               const std::shared_ptr<std::atomic<bool>>& interruptFlag) const {
    std::vector<const TransferSpec*> selected;
    for (const auto& s : specs)
        if (s.phase() == phase) selected.push_back(&s);

    if (selected.empty()) return {};

    const auto n = static_cast<unsigned int>(selected.size());
    const auto workers = opts_.max_concurrency == 0 ? n : std::min(opts_.max_concurrency, n);

    Registry::transfer()->info("[Executor] {} phase: {} transfer(s) on {} worker(s)", to_string(phase), n, workers);

    std::vector<std::shared_future<ExpectedFuture>> futures;
    futures.reserve(selected.size());

    {
        ThreadPool pool(workers);

        // Same-destination specs are chained so the later declaration writes last.
        // Predecessors are always submitted first, so a FIFO pool cannot deadlock.
        std::map<std::string, std::shared_future<ExpectedFuture>> lastWriter;

        for (const auto* spec : selected) {
            std::optional<std::shared_future<ExpectedFuture>> after;
            const auto dest = spec->destination();
            if (const auto it = lastWriter.find(dest); it != lastWriter.end()) after = it->second;

            auto task = std::make_shared<tasks::Transfer>(*spec, interruptFlag, opts_.default_timeout, after);
            auto fut = task->getFuture().value().share();
            lastWriter[dest] = fut;
            futures.push_back(fut);
            pool.submit(task);
        }

        for (const auto& f : futures) f.wait();
    }

    std::vector<TransferResult> results;
    results.reserve(futures.size());
    for (const auto& f : futures) results.push_back(*std::get<std::shared_ptr<TransferResult>>(f.get()));

    const auto failed = std::ranges::count_if(results, [](const auto& r) { return !r.succeeded; });
    if (failed) Registry::transfer()->warn("[Executor] {} phase: {} of {} transfer(s) failed", to_string(phase), failed, n);
    else Registry::transfer()->info("[Executor] {} phase: all {} transfer(s) succeeded", to_string(phase), n);

    return results;
}

std::vector<Diagnostic> Executor::conflicts(const std::vector<TransferSpec>& specs, const Phase phase) {
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> byDest;

    for (const auto& s : specs) {
        if (s.phase() != phase) continue;
        const auto dest = s.destination();
        auto& ids = byDest[dest];
        if (ids.empty()) order.push_back(dest);
        ids.push_back(s.id());
    }

    std::vector<Diagnostic> out;
    for (const auto& dest : order) {
        const auto& ids = byDest[dest];
        if (ids.size() < 2) continue;
        Diagnostic d;
        d.kind = ErrorKind::AuthorConflict;
        d.phase = phase;
        d.destination = dest;
        d.spec_ids = ids;
        d.message = fmt::format("{} transfers write '{}' in the {} phase ({}); '{}' is applied last",
                                ids.size(), dest, to_string(phase), fmt::join(ids, ", "), ids.back());
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<Diagnostic> Executor::checkConflicts(const std::vector<TransferSpec>& specs) const {
    auto diags = conflicts(specs, Phase::Pre);
    auto post = conflicts(specs, Phase::Post);
    diags.insert(diags.end(), std::make_move_iterator(post.begin()), std::make_move_iterator(post.end()));

    for (const auto& d : diags) {
        if (opts_.duplicates == config::DuplicatePolicy::Error)
            throw TransferError(ErrorKind::AuthorConflict, d.message);
        Registry::transfer()->warn("[Executor] {}", d.message);
    }
    return diags;
}
