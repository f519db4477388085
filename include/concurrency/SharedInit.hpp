#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace pt::concurrency {

// One-time lazy initialization shared by concurrent callers. The first caller
// runs the factory while the others wait on the same shared_future; a failed
// factory rethrows its exception to every waiter of that attempt and clears
// the slot, so the next call starts a fresh attempt.
template <typename T>
class SharedInit {
public:
    using Factory = std::function<std::shared_ptr<T>()>;

    explicit SharedInit(Factory factory) : factory_(std::move(factory)) {}

    std::shared_ptr<T> get() {
        std::shared_future<std::shared_ptr<T>> fut;
        bool owner = false;
        std::promise<std::shared_ptr<T>> promise;
        {
            std::scoped_lock lock(mutex_);
            if (!future_) {
                future_ = promise.get_future().share();
                owner = true;
            }
            fut = *future_;
        }

        if (owner) {
            try {
                promise.set_value(factory_());
            } catch (...) {
                promise.set_exception(std::current_exception());
                std::scoped_lock lock(mutex_);
                future_.reset();
            }
        }

        return fut.get();
    }

    [[nodiscard]] bool ready() const {
        std::scoped_lock lock(mutex_);
        return future_ && future_->wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

private:
    Factory factory_;
    mutable std::mutex mutex_;
    std::optional<std::shared_future<std::shared_ptr<T>>> future_;
};

}
