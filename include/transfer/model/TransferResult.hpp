#pragma once

#include "transfer/model/Error.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pt::transfer::model {

// Outcome of one TransferSpec. A failed result always carries an ErrorKind.
struct TransferResult {
    std::string spec_id;
    bool succeeded{false};
    std::optional<ErrorKind> error;
    std::string message;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    static TransferResult success(std::string specId,
                                  std::chrono::system_clock::time_point started,
                                  std::chrono::system_clock::time_point finished);

    static TransferResult failure(std::string specId, ErrorKind kind, std::string message,
                                  std::chrono::system_clock::time_point started,
                                  std::chrono::system_clock::time_point finished);

    [[nodiscard]] std::chrono::milliseconds duration() const;
};

[[nodiscard]] bool allSucceeded(const std::vector<TransferResult>& results);
[[nodiscard]] const TransferResult* firstFailure(const std::vector<TransferResult>& results);

void to_json(nlohmann::json& j, const TransferResult& r);
void from_json(const nlohmann::json& j, TransferResult& r);

}
