#include "transfer/model/TaskOutcome.hpp"

using namespace pt::transfer::model;

void pt::transfer::model::to_json(nlohmann::json& j, const TaskFailure& f) {
    j = {
        {"kind", to_string(f.kind)},
        {"message", f.message}
    };
    if (f.spec_id) j["spec_id"] = *f.spec_id;
}

void pt::transfer::model::to_json(nlohmann::json& j, const Diagnostic& d) {
    j = {
        {"kind", to_string(d.kind)},
        {"phase", to_string(d.phase)},
        {"destination", d.destination},
        {"spec_ids", d.spec_ids},
        {"message", d.message}
    };
}

void pt::transfer::model::to_json(nlohmann::json& j, const TaskOutcome& o) {
    j = {
        {"task", o.task_name},
        {"invocation_id", o.invocation_id},
        {"status", o.ok() ? "COMPLETED" : o.taskSucceeded() ? "OUTPUT_STAGING_FAILED" : "FAILED"},
        {"body_invoked", o.body_invoked},
        {"pre_transfer_results", o.pre_transfer_results},
        {"post_transfer_results", o.post_transfer_results},
        {"diagnostics", o.diagnostics}
    };
    if (o.value) j["value"] = *o.value;
    if (o.failure) j["failure"] = *o.failure;
}
