#pragma once

#include "transfer/model/TransferDecl.hpp"

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pt::task {

// Reserved keyword argument receiving the (source, destination) pairs.
inline constexpr const char* FILES_PARAM = "files";

using TaskBody = std::function<nlohmann::json(const nlohmann::json& args, const nlohmann::json& kwargs)>;

struct TaskArgs {
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
};

// A task together with its declared file dependencies.
struct TaskDefinition {
    std::string name;
    std::vector<transfer::model::TransferDecl> files;
    TaskBody body;
};

}
