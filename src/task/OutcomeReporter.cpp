#include "task/OutcomeReporter.hpp"
#include "log/Registry.hpp"

using namespace pt::task;
using namespace pt::transfer::model;
using namespace pt::log;

void StreamReporter::report(const TaskOutcome& outcome) {
    const nlohmann::json j = outcome;
    std::scoped_lock lock(mutex_);
    out_ << j.dump(indent_) << '\n';
    out_.flush();
}

void LogReporter::report(const TaskOutcome& outcome) {
    if (outcome.ok()) {
        Registry::task()->info("[{}] {} completed ({} pre, {} post transfers)", outcome.task_name,
                               outcome.invocation_id, outcome.pre_transfer_results.size(),
                               outcome.post_transfer_results.size());
        return;
    }

    if (outcome.failure) {
        Registry::task()->error("[{}] {} failed: {}{}: {}", outcome.task_name, outcome.invocation_id,
                                to_string(outcome.failure->kind),
                                outcome.failure->spec_id ? " (" + *outcome.failure->spec_id + ")" : "",
                                outcome.failure->message);
        return;
    }

    const auto* failed = firstFailure(outcome.post_transfer_results);
    Registry::task()->warn("[{}] {} succeeded but output staging failed: {} {}", outcome.task_name,
                           outcome.invocation_id, failed ? failed->spec_id : "",
                           failed && failed->error ? to_string(*failed->error) : "");
}
