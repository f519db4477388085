#include "transfer/tasks/Transfer.hpp"
#include "transfer/Context.hpp"
#include "transfer/model/TransferResult.hpp"
#include "storage/Strategy.hpp"
#include "log/Registry.hpp"

#include <filesystem>

using namespace pt::transfer::tasks;
using namespace pt::transfer::model;
using namespace pt::transfer;
using namespace pt::log;
using namespace std::chrono;

Transfer::Transfer(TransferSpec s,
                   std::shared_ptr<std::atomic<bool>> flag,
                   std::optional<milliseconds> fallbackTimeout,
                   std::optional<std::shared_future<ExpectedFuture>> after)
    : spec(std::move(s)), interruptFlag(std::move(flag)),
      defaultTimeout(fallbackTimeout), predecessor(std::move(after)) {}

void Transfer::operator()() {
    if (predecessor) predecessor->wait();

    const auto started = system_clock::now();
    std::optional<ErrorKind> kind;
    std::string message;

    try {
        const auto ctx = Context::withTimeout(interruptFlag, spec.timeout() ? spec.timeout() : defaultTimeout);
        ctx.checkpoint();

        if (spec.direction() == Direction::ToLocal)
            spec.strategy()->download(spec.remote(), spec.localPath(), ctx);
        else
            spec.strategy()->upload(spec.localPath(), spec.remote(), ctx);
    } catch (const TransferError& e) {
        kind = e.kind();
        message = e.what();
    } catch (const std::filesystem::filesystem_error& e) {
        kind = ErrorKind::LocalIOFailure;
        message = e.what();
    } catch (const std::exception& e) {
        kind = ErrorKind::TransportFailure;
        message = e.what();
    } catch (...) {
        kind = ErrorKind::TransportFailure;
        message = "unknown exception from storage strategy";
    }

    const auto finished = system_clock::now();

    std::shared_ptr<TransferResult> result;
    if (kind) {
        Registry::transfer()->error("[Transfer] {} ({} {}) failed: {}: {}",
                                    spec.id(), to_string(spec.direction()), spec.remote().str(), to_string(*kind), message);
        result = std::make_shared<TransferResult>(TransferResult::failure(spec.id(), *kind, message, started, finished));
    } else {
        result = std::make_shared<TransferResult>(TransferResult::success(spec.id(), started, finished));
        Registry::transfer()->debug("[Transfer] {} done in {} ms", spec.id(), result->duration().count());
    }

    promise.set_value(result);
}
