#pragma once

#include "transfer/model/Direction.hpp"
#include "transfer/model/Locator.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace pt::storage { class Strategy; }

namespace pt::transfer::model {

struct TransferOptions {
    std::optional<std::chrono::milliseconds> timeout;
    bool skip_on_task_failure = false;
};

// One fully resolved file movement. Validated on construction and immutable
// afterwards: a relative local path throws PathUnresolved, a locator the
// strategy cannot serve throws SchemeMismatch, and an upload bound to a
// read-only strategy throws UnsupportedOperation.
class TransferSpec {
public:
    TransferSpec(std::string id,
                 Direction direction,
                 Locator remote,
                 std::filesystem::path localPath,
                 std::shared_ptr<storage::Strategy> strategy,
                 TransferOptions options = {});

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] Direction direction() const { return direction_; }
    [[nodiscard]] Phase phase() const { return phaseOf(direction_); }
    [[nodiscard]] const Locator& remote() const { return remote_; }
    [[nodiscard]] const std::filesystem::path& localPath() const { return local_; }
    [[nodiscard]] const std::shared_ptr<storage::Strategy>& strategy() const { return strategy_; }
    [[nodiscard]] const std::optional<std::chrono::milliseconds>& timeout() const { return options_.timeout; }
    [[nodiscard]] bool skipOnTaskFailure() const { return options_.skip_on_task_failure; }

    // (source, destination) as handed to the task body
    [[nodiscard]] std::pair<std::string, std::string> pathPair() const;

    // Where this spec writes: the local path for downloads, the locator for uploads.
    [[nodiscard]] std::string destination() const;

private:
    std::string id_;
    Direction direction_;
    Locator remote_;
    std::filesystem::path local_;
    std::shared_ptr<storage::Strategy> strategy_;
    TransferOptions options_;
};

}
