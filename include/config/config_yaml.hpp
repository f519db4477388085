#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pt::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const char* key, const spdlog::level::level_enum def) {
    if (!node[key]) return def;
    return spdlog::level::from_str(node[key].as<std::string>());
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["porter"]   = to_std_string(spdlog::level::to_string_view(rhs.porter));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["ssh"]      = to_std_string(spdlog::level::to_string_view(rhs.ssh));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["task"]     = to_std_string(spdlog::level::to_string_view(rhs.task));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.porter   = levelOr(node, "porter", def.porter);
        rhs.transfer = levelOr(node, "transfer", def.transfer);
        rhs.storage  = levelOr(node, "storage", def.storage);
        rhs.cloud    = levelOr(node, "cloud", def.cloud);
        rhs.ssh      = levelOr(node, "ssh", def.ssh);
        rhs.http     = levelOr(node, "http", def.http);
        rhs.task     = levelOr(node, "task", def.task);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node, "console_log_level", spdlog::level::info);
        rhs.file_log_level = levelOr(node, "file_log_level", spdlog::level::warn);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(pt::paths::getLogPath().string());
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["max_concurrency"] = rhs.max_concurrency;
        node["default_timeout_seconds"] = rhs.default_timeout_seconds;
        node["work_root"] = rhs.work_root.string();
        node["keep_work_dirs"] = rhs.keep_work_dirs;
        node["duplicate_destinations"] = pt::config::to_string(rhs.duplicate_destinations);
        node["part_size_bytes"] = rhs.part_size_bytes;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_concurrency = node["max_concurrency"].as<unsigned int>(0);
        rhs.default_timeout_seconds = node["default_timeout_seconds"].as<unsigned int>(0);
        rhs.work_root = node["work_root"].as<std::string>(pt::paths::getWorkRoot().string());
        rhs.keep_work_dirs = node["keep_work_dirs"].as<bool>(false);
        rhs.duplicate_destinations = duplicate_policy_from_string(node["duplicate_destinations"].as<std::string>("warn"));
        rhs.part_size_bytes = std::max(node["part_size_bytes"].as<uintmax_t>(DEFAULT_PART_SIZE_BYTES), MIN_PART_SIZE_BYTES);
        return true;
    }
};

template<>
struct convert<StrategyConfig> {
    static Node encode(const StrategyConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["type"] = rhs.type;
        node["scheme"] = rhs.scheme;
        if (!rhs.credentials_path.empty()) node["credentials_path"] = rhs.credentials_path;
        if (!rhs.project.empty()) node["project"] = rhs.project;
        if (!rhs.endpoint.empty()) node["endpoint"] = rhs.endpoint;
        if (!rhs.region.empty()) node["region"] = rhs.region;
        if (!rhs.access_key.empty()) node["access_key"] = rhs.access_key;
        if (!rhs.host.empty()) node["host"] = rhs.host;
        if (!rhs.user.empty()) node["user"] = rhs.user;
        if (rhs.port) node["port"] = *rhs.port;
        node["program"] = rhs.program;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["upload_enabled"] = rhs.upload_enabled;
        node["verify_tls"] = rhs.verify_tls;
        // secret_access_key is never written back out
        return node;
    }

    static bool decode(const Node& node, StrategyConfig& rhs) {
        if (!node.IsMap() || !node["type"]) return false;
        rhs.type = node["type"].as<std::string>();
        rhs.name = node["name"].as<std::string>(rhs.type);
        rhs.scheme = node["scheme"].as<std::string>("");
        rhs.credentials_path = node["credentials_path"].as<std::string>("");
        rhs.project = node["project"].as<std::string>("");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        rhs.host = node["host"].as<std::string>("");
        rhs.user = node["user"].as<std::string>("");
        if (node["port"]) rhs.port = node["port"].as<uint16_t>();
        rhs.program = node["program"].as<std::string>("scp");
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(10);
        rhs.upload_enabled = node["upload_enabled"].as<bool>(false);
        rhs.verify_tls = node["verify_tls"].as<bool>(true);
        return true;
    }
};

}
