#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace pt::config {

constexpr static uintmax_t MIN_PART_SIZE_BYTES = 5 * 1024 * 1024;      // S3 multipart floor
constexpr static uintmax_t DEFAULT_PART_SIZE_BYTES = 8 * 1024 * 1024;

enum class DuplicatePolicy { Warn, Error };

std::string to_string(DuplicatePolicy policy);
DuplicatePolicy duplicate_policy_from_string(const std::string& str);

struct TransferConfig {
    unsigned int max_concurrency = 0;           // 0 = one worker per spec in the phase
    unsigned int default_timeout_seconds = 0;   // 0 = no deadline
    std::filesystem::path work_root;
    bool keep_work_dirs = false;
    DuplicatePolicy duplicate_destinations = DuplicatePolicy::Warn;
    uintmax_t part_size_bytes = DEFAULT_PART_SIZE_BYTES;
};

struct StrategyConfig {
    std::string name;
    std::string type;                           // local | remote_host | object_store | http
    std::string scheme;

    // Object store
    std::string credentials_path;
    std::string project;
    std::string endpoint;
    std::string region;
    std::string access_key;
    std::string secret_access_key;

    // Remote host
    std::string host;
    std::string user;
    std::optional<uint16_t> port;
    std::string program = "scp";                // scp | rsync
    unsigned int connect_timeout_seconds = 10;

    // HTTP
    bool upload_enabled = false;
    bool verify_tls = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum porter   = spdlog::level::info;   // startup, CLI, invocation summaries
    spdlog::level::level_enum transfer = spdlog::level::info;   // phase boundaries and per-spec results
    spdlog::level::level_enum storage  = spdlog::level::warn;   // local copies and staging files
    spdlog::level::level_enum cloud    = spdlog::level::warn;   // object store requests
    spdlog::level::level_enum ssh      = spdlog::level::warn;   // remote copy child processes
    spdlog::level::level_enum http     = spdlog::level::warn;   // plain http(s) fetches
    spdlog::level::level_enum task     = spdlog::level::info;   // task body failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    LoggingConfig logging;
    TransferConfig transfer;
    std::vector<StrategyConfig> strategies;

    Config();
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void from_json(const nlohmann::json& j, TransferConfig& c);
void to_json(nlohmann::json& j, const StrategyConfig& c);
void from_json(const nlohmann::json& j, StrategyConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);

} // namespace pt::config
