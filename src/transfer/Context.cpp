#include "transfer/Context.hpp"
#include "transfer/model/Error.hpp"

#include <algorithm>

using namespace pt::transfer;
using namespace std::chrono;

Context Context::withTimeout(std::shared_ptr<std::atomic<bool>> flag, const std::optional<milliseconds>& timeout) {
    Context ctx;
    ctx.interruptFlag = std::move(flag);
    if (timeout && timeout->count() > 0) ctx.deadline = steady_clock::now() + *timeout;
    return ctx;
}

std::optional<milliseconds> Context::remaining() const {
    if (!deadline) return std::nullopt;
    const auto left = duration_cast<milliseconds>(*deadline - steady_clock::now());
    return std::max(left, milliseconds(0));
}

void Context::checkpoint() const {
    if (isInterrupted()) throw TransferError(model::ErrorKind::Cancelled, "Transfer cancelled");
    if (isExpired()) throw TransferError(model::ErrorKind::NetworkTimeout, "Transfer deadline exceeded");
}
