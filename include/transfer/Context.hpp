#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace pt::transfer {

// Cancellation and deadline state handed to a strategy for one transfer.
struct Context {
    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    static Context withTimeout(std::shared_ptr<std::atomic<bool>> flag,
                               const std::optional<std::chrono::milliseconds>& timeout);

    [[nodiscard]] bool isInterrupted() const { return interruptFlag && interruptFlag->load(); }
    [[nodiscard]] bool isExpired() const { return deadline && std::chrono::steady_clock::now() >= *deadline; }

    // Time left before the deadline, nullopt when unbounded.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    // Throws TransferError(Cancelled) or TransferError(NetworkTimeout).
    void checkpoint() const;
};

}
