#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "storage/Registry.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pt::config;

namespace {
std::atomic<bool>* interruptFlag = nullptr;

void signalHandler(const int) {
    if (interruptFlag) interruptFlag->store(true);
}
}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ConfigRegistry::init();
        pt::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "porter: failed to initialize: " << e.what() << std::endl;
        return pt::cli::EXIT_FAILED;
    }

    const auto flag = std::make_shared<std::atomic<bool>>(false);
    interruptFlag = flag.get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const auto registry = std::make_shared<pt::storage::Registry>(ConfigRegistry::get());
        const pt::cli::CommandContext ctx{ConfigRegistry::get(), registry, flag, std::cout, std::cerr};
        return pt::cli::dispatch(args, ctx);
    } catch (const std::exception& e) {
        pt::log::Registry::porter()->critical("[main] {}", e.what());
        std::cerr << "porter: " << e.what() << std::endl;
        return pt::cli::EXIT_FAILED;
    }
}
