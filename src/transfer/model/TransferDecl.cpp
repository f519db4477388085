#include "transfer/model/TransferDecl.hpp"
#include "transfer/model/Locator.hpp"
#include "transfer/model/Error.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using namespace pt::transfer;
using namespace pt::transfer::model;

TransferDecl TransferDecl::download(std::string remote, std::string local) {
    TransferDecl d;
    d.direction = Direction::ToLocal;
    d.remote = std::move(remote);
    d.local = std::move(local);
    return d;
}

TransferDecl TransferDecl::upload(std::string local, std::string remote) {
    TransferDecl d;
    d.direction = Direction::ToRemote;
    d.local = std::move(local);
    d.remote = std::move(remote);
    return d;
}

TransferDecl TransferDecl::between(const std::string& from, const std::string& to) {
    const auto src = Locator::parse(from);
    const auto dst = Locator::parse(to);

    if (src.isRemote() && dst.isRemote())
        throw TransferError(ErrorKind::SchemeMismatch,
                            fmt::format("Cannot transfer between two remote locators: '{}' -> '{}'", from, to));

    if (src.isRemote()) return download(from, dst.path);
    if (dst.isRemote()) return upload(src.path, to);

    // local -> local: the source plays the remote side for the Local strategy
    return download(from, dst.path);
}

void pt::transfer::model::from_json(const nlohmann::json& j, TransferDecl& d) {
    if (j.contains("from") || j.contains("to")) {
        d = TransferDecl::between(j.at("from").get<std::string>(), j.at("to").get<std::string>());
    } else {
        d.direction = direction_from_string(j.at("direction").get<std::string>());
        d.remote = j.at("remote").get<std::string>();
        d.local = j.value("local", "");
    }

    if (j.contains("id")) d.id = j.at("id").get<std::string>();
    d.strategy_name = j.value("strategy", "");
    if (j.contains("timeout_seconds")) d.timeout = std::chrono::seconds(j.at("timeout_seconds").get<unsigned int>());
    d.skip_on_task_failure = j.value("skip_on_task_failure", false);
}

void pt::transfer::model::to_json(nlohmann::json& j, const TransferDecl& d) {
    j = {
        {"direction", to_string(d.direction)},
        {"remote", d.remote},
        {"local", d.local},
        {"skip_on_task_failure", d.skip_on_task_failure}
    };
    if (d.id) j["id"] = *d.id;
    if (!d.strategy_name.empty()) j["strategy"] = d.strategy_name;
    if (d.timeout) j["timeout_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(*d.timeout).count();
}
