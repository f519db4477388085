#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/paths.hpp"

#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace pt::config {

static std::string levelName(const spdlog::level::level_enum l) {
    const auto sv = spdlog::level::to_string_view(l);
    return {sv.data(), sv.size()};
}

std::string to_string(const DuplicatePolicy policy) {
    switch (policy) {
    case DuplicatePolicy::Warn: return "warn";
    case DuplicatePolicy::Error: return "error";
    }
    return "warn";
}

DuplicatePolicy duplicate_policy_from_string(const std::string& str) {
    if (str == "warn") return DuplicatePolicy::Warn;
    if (str == "error") return DuplicatePolicy::Error;
    throw std::invalid_argument("Unknown duplicate_destinations policy: " + str);
}

Config::Config() {
    logging.log_dir = paths::getLogPath();
    transfer.work_root = paths::getWorkRoot();
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);

    if (auto node = root["strategies"]) {
        if (!node.IsSequence()) throw std::runtime_error("Config: 'strategies' must be a list");
        for (const auto& entry : node) {
            StrategyConfig s;
            if (!YAML::convert<StrategyConfig>::decode(entry, s))
                throw std::runtime_error(fmt::format("Config: strategy entry #{} is missing 'type'", cfg.strategies.size()));
            cfg.strategies.push_back(std::move(s));
        }
    }

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"transfer", c.transfer},
        {"strategies", c.strategies}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("transfer")) j.at("transfer").get_to(c.transfer);
    if (j.contains("strategies")) j.at("strategies").get_to(c.strategies);
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"max_concurrency", c.max_concurrency},
        {"default_timeout_seconds", c.default_timeout_seconds},
        {"work_root", c.work_root.string()},
        {"keep_work_dirs", c.keep_work_dirs},
        {"duplicate_destinations", to_string(c.duplicate_destinations)},
        {"part_size_bytes", c.part_size_bytes}
    };
}

void from_json(const nlohmann::json& j, TransferConfig& c) {
    c.max_concurrency = j.value("max_concurrency", 0u);
    c.default_timeout_seconds = j.value("default_timeout_seconds", 0u);
    c.work_root = j.value("work_root", paths::getWorkRoot().string());
    c.keep_work_dirs = j.value("keep_work_dirs", false);
    c.duplicate_destinations = duplicate_policy_from_string(j.value("duplicate_destinations", std::string("warn")));
    c.part_size_bytes = std::max(j.value("part_size_bytes", DEFAULT_PART_SIZE_BYTES), MIN_PART_SIZE_BYTES);
}

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = {
        {"name", c.name},
        {"type", c.type},
        {"scheme", c.scheme},
        {"credentials_path", c.credentials_path},
        {"project", c.project},
        {"endpoint", c.endpoint},
        {"region", c.region},
        {"access_key", c.access_key},
        {"host", c.host},
        {"user", c.user},
        {"program", c.program},
        {"connect_timeout_seconds", c.connect_timeout_seconds},
        {"upload_enabled", c.upload_enabled},
        {"verify_tls", c.verify_tls}
        // Do not serialize secret_access_key
    };
    if (c.port) j["port"] = *c.port;
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    c.type = j.at("type").get<std::string>();
    c.name = j.value("name", c.type);
    c.scheme = j.value("scheme", "");
    c.credentials_path = j.value("credentials_path", "");
    c.project = j.value("project", "");
    c.endpoint = j.value("endpoint", "");
    c.region = j.value("region", "");
    c.access_key = j.value("access_key", "");
    c.secret_access_key = j.value("secret_access_key", "");
    c.host = j.value("host", "");
    c.user = j.value("user", "");
    if (j.contains("port")) c.port = j.at("port").get<uint16_t>();
    c.program = j.value("program", "scp");
    c.connect_timeout_seconds = j.value("connect_timeout_seconds", 10u);
    c.upload_enabled = j.value("upload_enabled", false);
    c.verify_tls = j.value("verify_tls", true);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", paths::getLogPath().string());
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "warn"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"porter", levelName(c.porter)},
        {"transfer", levelName(c.transfer)},
        {"storage", levelName(c.storage)},
        {"cloud", levelName(c.cloud)},
        {"ssh", levelName(c.ssh)},
        {"http", levelName(c.http)},
        {"task", levelName(c.task)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.porter = spdlog::level::from_str(j.value("porter", "info"));
    c.transfer = spdlog::level::from_str(j.value("transfer", "info"));
    c.storage = spdlog::level::from_str(j.value("storage", "warn"));
    c.cloud = spdlog::level::from_str(j.value("cloud", "warn"));
    c.ssh = spdlog::level::from_str(j.value("ssh", "warn"));
    c.http = spdlog::level::from_str(j.value("http", "warn"));
    c.task = spdlog::level::from_str(j.value("task", "info"));
}

} // namespace pt::config
