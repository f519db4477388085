#pragma once

#include "storage/Strategy.hpp"
#include "transfer/Context.hpp"
#include "transfer/model/Error.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pt::test {

// In-memory object store behind "store://bucket/key" locators, with
// per-key latency, failure and truncation injection.
class FakeStrategy final : public storage::Strategy {
public:
    explicit FakeStrategy(std::string name = "fake", const bool readOnly = false)
        : Strategy(makeConfig(std::move(name))), readOnly_(readOnly) {}

    [[nodiscard]] storage::StrategyType type() const override { return storage::StrategyType::ObjectStore; }
    [[nodiscard]] std::vector<std::string> schemes() const override { return {"store"}; }
    [[nodiscard]] bool canUpload() const override { return !readOnly_; }

    void put(const std::string& key, std::string data) {
        std::scoped_lock lock(mutex_);
        objects_[key] = std::move(data);
    }

    [[nodiscard]] std::optional<std::string> object(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        if (const auto it = objects_.find(key); it != objects_.end()) return it->second;
        return std::nullopt;
    }

    void delay(const std::string& key, const std::chrono::milliseconds d) {
        std::scoped_lock lock(mutex_);
        delays_[key] = d;
    }

    void failWith(const std::string& key, const transfer::model::ErrorKind kind) {
        std::scoped_lock lock(mutex_);
        failures_[key] = kind;
    }

    // Download writes half the object, then fails mid-stream.
    void truncate(const std::string& key) {
        std::scoped_lock lock(mutex_);
        truncated_.push_back(key);
    }

    [[nodiscard]] std::vector<std::string> completed() const {
        std::scoped_lock lock(mutex_);
        return completed_;
    }

    [[nodiscard]] int maxActive() const { return maxActive_.load(); }
    [[nodiscard]] int calls() const { return calls_.load(); }

    static std::string keyOf(const transfer::model::Locator& loc) { return loc.host + loc.path; }

    void download(const transfer::model::Locator& remote, const std::filesystem::path& local,
                  const transfer::Context& ctx) const override {
        const auto key = keyOf(remote);
        const Active active(*this);
        simulate(key, ctx);

        std::string data;
        bool cut = false;
        {
            std::scoped_lock lock(mutex_);
            const auto it = objects_.find(key);
            if (it == objects_.end())
                throw transfer::TransferError(transfer::model::ErrorKind::ObjectNotFound, "no such object: " + key);
            data = it->second;
            cut = std::find(truncated_.begin(), truncated_.end(), key) != truncated_.end();
        }

        util::StagingFile staged(local);
        if (cut) {
            util::writeFile(staged.path(), data.substr(0, data.size() / 2));
            throw transfer::TransferError(transfer::model::ErrorKind::TransportFailure, "connection reset: " + key);
        }
        util::writeFile(staged.path(), data);
        staged.commit();
        finished(local.string());
    }

    void upload(const std::filesystem::path& local, const transfer::model::Locator& remote,
                const transfer::Context& ctx) const override {
        const auto key = keyOf(remote);
        const Active active(*this);
        simulate(key, ctx);

        if (!std::filesystem::exists(local))
            throw transfer::TransferError(transfer::model::ErrorKind::LocalIOFailure, "missing " + local.string());
        const auto data = util::readFileToString(local);
        {
            std::scoped_lock lock(mutex_);
            objects_[key] = data;
        }
        finished(key);
    }

private:
    struct Active {
        const FakeStrategy& s;
        explicit Active(const FakeStrategy& f) : s(f) {
            ++s.calls_;
            const int now = ++s.active_;
            int prev = s.maxActive_.load();
            while (now > prev && !s.maxActive_.compare_exchange_weak(prev, now)) {}
        }
        ~Active() { --s.active_; }
    };

    static config::StrategyConfig makeConfig(std::string name) {
        config::StrategyConfig cfg;
        cfg.name = std::move(name);
        cfg.type = "object_store";
        cfg.scheme = "store";
        return cfg;
    }

    void simulate(const std::string& key, const transfer::Context& ctx) const {
        std::chrono::milliseconds d{0};
        std::optional<transfer::model::ErrorKind> failure;
        {
            std::scoped_lock lock(mutex_);
            if (const auto it = delays_.find(key); it != delays_.end()) d = it->second;
            if (const auto it = failures_.find(key); it != failures_.end()) failure = it->second;
        }

        const auto until = std::chrono::steady_clock::now() + d;
        while (std::chrono::steady_clock::now() < until) {
            ctx.checkpoint();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ctx.checkpoint();

        if (failure) throw transfer::TransferError(*failure, "injected failure for " + key);
    }

    void finished(const std::string& what) const {
        std::scoped_lock lock(mutex_);
        completed_.push_back(what);
    }

    bool readOnly_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, std::string> objects_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::map<std::string, transfer::model::ErrorKind> failures_;
    std::vector<std::string> truncated_;
    mutable std::vector<std::string> completed_;
    mutable std::atomic<int> active_{0};
    mutable std::atomic<int> maxActive_{0};
    mutable std::atomic<int> calls_{0};
};

}
