#include "cli/Commands.hpp"
#include "config/Config.hpp"
#include "storage/Registry.hpp"
#include "storage/Strategy.hpp"
#include "task/Binder.hpp"
#include "task/TaskDefinition.hpp"
#include "transfer/Context.hpp"
#include "transfer/Executor.hpp"
#include "transfer/model/Error.hpp"
#include "transfer/model/Locator.hpp"
#include "transfer/model/TransferDecl.hpp"
#include "transfer/model/TransferSpec.hpp"
#include "util/files.hpp"
#include "util/process.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace pt::cli;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;
namespace fs = std::filesystem;

namespace {

struct UsageError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

int reportResult(const TransferResult& r, const CommandContext& ctx) {
    ctx.out << nlohmann::json(r).dump(2) << std::endl;
    if (r.succeeded) return EXIT_OK;
    ctx.err << fmt::format("porter: {} failed ({}): {}", r.spec_id,
                           to_string(r.error.value_or(ErrorKind::TransportFailure)), r.message) << std::endl;
    return EXIT_FAILED;
}

int single(const Direction dir, const std::string& remoteStr, const std::string& localStr,
           const CommandContext& ctx) {
    const auto remote = Locator::parse(remoteStr);
    const auto local = fs::absolute(localStr);
    const auto strategy = ctx.registry->forLocator(remote);
    const auto opts = ExecutorOptions::fromConfig(ctx.config.transfer);

    const TransferSpec spec(dir == Direction::ToLocal ? "get" : "put", dir, remote, local, strategy,
                            TransferOptions{opts.default_timeout, false});
    const Executor executor(opts);
    const auto results = executor.runPhase({spec}, spec.phase(), ctx.interruptFlag);
    return reportResult(results.front(), ctx);
}

}

std::string pt::cli::usage() {
    return "usage: porter <command> [args...]\n"
           "\n"
           "  get <locator> <path>                    download one object to a local path\n"
           "  put <path> <locator>                    upload one local file\n"
           "  run <manifest.json> -- <cmd> [args...]  stage the manifest's files around <cmd>\n"
           "  config                                  print the effective configuration\n";
}

int pt::cli::cmdGet(const std::vector<std::string>& args, const CommandContext& ctx) {
    if (args.size() != 2) throw UsageError("get expects <locator> <path>");
    return single(Direction::ToLocal, args[0], args[1], ctx);
}

int pt::cli::cmdPut(const std::vector<std::string>& args, const CommandContext& ctx) {
    if (args.size() != 2) throw UsageError("put expects <path> <locator>");
    return single(Direction::ToRemote, args[1], args[0], ctx);
}

int pt::cli::cmdConfig(const std::vector<std::string>& args, const CommandContext& ctx) {
    if (!args.empty()) throw UsageError("config takes no arguments");
    ctx.out << nlohmann::json(ctx.config).dump(2) << std::endl;
    return EXIT_OK;
}

pt::task::TaskDefinition pt::cli::manifestTask(const nlohmann::json& manifest,
                                               std::vector<std::string> command,
                                               std::shared_ptr<std::atomic<bool>> interruptFlag) {
    if (!manifest.is_object()) throw std::invalid_argument("Manifest must be a JSON object");
    if (command.empty()) throw std::invalid_argument("No command given");

    task::TaskDefinition def;
    def.name = manifest.value("name", fs::path(command.front()).filename().string());
    if (manifest.contains("files")) def.files = manifest.at("files").get<std::vector<TransferDecl>>();

    def.body = [command = std::move(command), flag = std::move(interruptFlag)](const nlohmann::json&,
                                                                             const nlohmann::json& kwargs) {
        util::ProcessOptions opts;
        opts.extraEnv[FILES_ENV] = kwargs.at(task::FILES_PARAM).dump();

        const auto res = util::runProcess(command, Context{flag, std::nullopt}, opts);
        if (!res.stderr_text.empty()) Registry::task()->info("[run] {} stderr:\n{}", command.front(), res.stderr_text);
        if (res.cancelled) throw std::runtime_error(fmt::format("'{}' was cancelled", command.front()));
        if (!res.ok()) throw std::runtime_error(fmt::format("'{}' exited with status {}", command.front(), res.exit_code));
        return nlohmann::json{{"exit_code", res.exit_code}};
    };
    return def;
}

int pt::cli::cmdRun(const std::vector<std::string>& args, const CommandContext& ctx) {
    const auto sep = std::find(args.begin(), args.end(), "--");
    if (sep == args.end() || sep == args.begin() || std::next(sep) == args.end())
        throw UsageError("run expects <manifest.json> -- <command> [args...]");
    if (std::distance(args.begin(), sep) != 1) throw UsageError("run takes exactly one manifest");

    const auto manifest = nlohmann::json::parse(util::readFileToString(args.front()));
    const auto def = manifestTask(manifest, {std::next(sep), args.end()}, ctx.interruptFlag);

    const auto binder = task::Binder(ctx.registry, task::BinderOptions::fromConfig(ctx.config));
    const auto outcome = binder.invoke(def, {}, ctx.interruptFlag);

    ctx.out << nlohmann::json(outcome).dump(2) << std::endl;
    if (outcome.ok()) return EXIT_OK;
    if (outcome.failure)
        ctx.err << fmt::format("porter: {} failed ({}): {}", def.name,
                               to_string(outcome.failure->kind), outcome.failure->message) << std::endl;
    else
        ctx.err << fmt::format("porter: {} output staging failed", def.name) << std::endl;
    return EXIT_FAILED;
}

int pt::cli::dispatch(const std::vector<std::string>& args, const CommandContext& ctx) {
    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        ctx.err << usage();
        return args.empty() ? EXIT_USAGE : EXIT_OK;
    }

    const auto& cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (cmd == "get") return cmdGet(rest, ctx);
        if (cmd == "put") return cmdPut(rest, ctx);
        if (cmd == "run") return cmdRun(rest, ctx);
        if (cmd == "config") return cmdConfig(rest, ctx);
        throw UsageError(fmt::format("unknown command '{}'", cmd));
    } catch (const UsageError& e) {
        ctx.err << "porter: " << e.what() << "\n\n" << usage();
        return EXIT_USAGE;
    } catch (const TransferError& e) {
        Registry::porter()->error("[cli] {} ({})", e.what(), to_string(e.kind()));
        ctx.err << fmt::format("porter: {} ({})", e.what(), to_string(e.kind())) << std::endl;
        return EXIT_FAILED;
    } catch (const nlohmann::json::exception& e) {
        ctx.err << "porter: invalid manifest: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        Registry::porter()->error("[cli] {}", e.what());
        ctx.err << "porter: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
