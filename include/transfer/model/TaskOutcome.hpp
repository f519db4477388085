#pragma once

#include "transfer/model/Direction.hpp"
#include "transfer/model/Error.hpp"
#include "transfer/model/TransferResult.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pt::transfer::model {

// Why an invocation did not produce a value: either the task body threw
// (TaskBodyFailure) or a pre-phase transfer failed, in which case spec_id
// names the offending spec.
struct TaskFailure {
    ErrorKind kind{ErrorKind::TaskBodyFailure};
    std::string message;
    std::optional<std::string> spec_id;
};

// Non-fatal authoring finding, e.g. two specs writing the same destination.
struct Diagnostic {
    ErrorKind kind{ErrorKind::AuthorConflict};
    Phase phase{Phase::Pre};
    std::string destination;
    std::vector<std::string> spec_ids;
    std::string message;
};

struct TaskOutcome {
    std::string task_name;
    std::string invocation_id;

    std::optional<nlohmann::json> value;
    std::optional<TaskFailure> failure;
    bool body_invoked{false};

    std::vector<TransferResult> pre_transfer_results;
    std::vector<TransferResult> post_transfer_results;
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool taskSucceeded() const { return !failure.has_value(); }

    // The "output staging failed" addendum; never overwrites the task value.
    [[nodiscard]] bool outputStagingFailed() const { return !allSucceeded(post_transfer_results); }

    [[nodiscard]] bool ok() const { return taskSucceeded() && !outputStagingFailed(); }
};

void to_json(nlohmann::json& j, const TaskFailure& f);
void to_json(nlohmann::json& j, const Diagnostic& d);
void to_json(nlohmann::json& j, const TaskOutcome& o);

}
