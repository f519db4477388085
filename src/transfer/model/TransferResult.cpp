#include "transfer/model/TransferResult.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace pt::transfer::model;
using namespace std::chrono;

TransferResult TransferResult::success(std::string specId,
                                       const system_clock::time_point started,
                                       const system_clock::time_point finished) {
    TransferResult r;
    r.spec_id = std::move(specId);
    r.succeeded = true;
    r.started_at = started;
    r.finished_at = finished;
    return r;
}

TransferResult TransferResult::failure(std::string specId, const ErrorKind kind, std::string message,
                                       const system_clock::time_point started,
                                       const system_clock::time_point finished) {
    TransferResult r;
    r.spec_id = std::move(specId);
    r.succeeded = false;
    r.error = kind;
    r.message = std::move(message);
    r.started_at = started;
    r.finished_at = finished;
    return r;
}

milliseconds TransferResult::duration() const {
    return duration_cast<milliseconds>(finished_at - started_at);
}

bool pt::transfer::model::allSucceeded(const std::vector<TransferResult>& results) {
    return std::ranges::all_of(results, [](const TransferResult& r) { return r.succeeded; });
}

const TransferResult* pt::transfer::model::firstFailure(const std::vector<TransferResult>& results) {
    const auto it = std::ranges::find_if(results, [](const TransferResult& r) { return !r.succeeded; });
    return it == results.end() ? nullptr : &*it;
}

void pt::transfer::model::to_json(nlohmann::json& j, const TransferResult& r) {
    j = {
        {"spec_id", r.spec_id},
        {"succeeded", r.succeeded},
        {"started_at", pt::util::timePointToString(r.started_at)},
        {"finished_at", pt::util::timePointToString(r.finished_at)},
        {"duration_ms", r.duration().count()}
    };
    if (r.error) j["error"] = to_string(*r.error);
    if (!r.message.empty()) j["message"] = r.message;
}

void pt::transfer::model::from_json(const nlohmann::json& j, TransferResult& r) {
    r.spec_id = j.at("spec_id").get<std::string>();
    r.succeeded = j.at("succeeded").get<bool>();
    if (j.contains("error")) r.error = error_kind_from_string(j.at("error").get<std::string>());
    r.message = j.value("message", "");
    r.started_at = pt::util::parseTimePoint(j.at("started_at").get<std::string>());
    r.finished_at = pt::util::parseTimePoint(j.at("finished_at").get<std::string>());
}
