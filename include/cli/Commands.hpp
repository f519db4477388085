#pragma once

#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pt::config { struct Config; }
namespace pt::storage { class Registry; }
namespace pt::task { struct TaskDefinition; }

namespace pt::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;

// Environment variable carrying the [[source, destination], ...] pairs to
// the child of `porter run`.
inline constexpr const char* FILES_ENV = "PORTER_FILES";

struct CommandContext {
    const config::Config& config;
    std::shared_ptr<storage::Registry> registry;
    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::ostream& out;
    std::ostream& err;
};

// argv without the program name. Returns the process exit status.
int dispatch(const std::vector<std::string>& args, const CommandContext& ctx);

int cmdGet(const std::vector<std::string>& args, const CommandContext& ctx);
int cmdPut(const std::vector<std::string>& args, const CommandContext& ctx);
int cmdRun(const std::vector<std::string>& args, const CommandContext& ctx);
int cmdConfig(const std::vector<std::string>& args, const CommandContext& ctx);

std::string usage();

// {"name": "...", "files": [<TransferDecl>, ...]} with the body running `command`.
task::TaskDefinition manifestTask(const nlohmann::json& manifest,
                                  std::vector<std::string> command,
                                  std::shared_ptr<std::atomic<bool>> interruptFlag);

}
