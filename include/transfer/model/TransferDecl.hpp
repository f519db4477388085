#pragma once

#include "transfer/model/Direction.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pt::storage { class Strategy; }

namespace pt::transfer::model {

// A file dependency as a task author declares it, before it is resolved
// against an invocation's working directory and a strategy.
//
// `local` may be absolute, relative to the working directory, or empty (the
// remote basename inside the working directory). With neither `strategy` nor
// `strategy_name` set the strategy is chosen by the remote scheme.
struct TransferDecl {
    std::optional<std::string> id;
    Direction direction{Direction::ToLocal};
    std::string remote;
    std::string local;
    std::shared_ptr<storage::Strategy> strategy;
    std::string strategy_name;
    std::optional<std::chrono::milliseconds> timeout;
    bool skip_on_task_failure = false;

    static TransferDecl download(std::string remote, std::string local = {});
    static TransferDecl upload(std::string local, std::string remote);

    // Direction from whichever side is remote. remote -> remote is a
    // SchemeMismatch; local -> local copies through the Local strategy.
    static TransferDecl between(const std::string& from, const std::string& to);

    TransferDecl& withId(std::string value) { id = std::move(value); return *this; }
    TransferDecl& via(std::shared_ptr<storage::Strategy> s) { strategy = std::move(s); return *this; }
    TransferDecl& via(std::string name) { strategy_name = std::move(name); return *this; }
    TransferDecl& withTimeout(const std::chrono::milliseconds t) { timeout = t; return *this; }
    TransferDecl& skipOnTaskFailure(const bool skip = true) { skip_on_task_failure = skip; return *this; }
};

// Manifest form: either {"from", "to"} or {"direction", "remote", "local"},
// plus optional "id", "strategy", "timeout_seconds", "skip_on_task_failure".
void from_json(const nlohmann::json& j, TransferDecl& d);
void to_json(nlohmann::json& j, const TransferDecl& d);

}
