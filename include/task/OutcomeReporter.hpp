#pragma once

#include "transfer/model/TaskOutcome.hpp"

#include <mutex>
#include <ostream>

namespace pt::task {

// Receives every finished TaskOutcome; stands in for the scheduler's result store.
class OutcomeReporter {
public:
    virtual ~OutcomeReporter() = default;
    virtual void report(const transfer::model::TaskOutcome& outcome) = 0;
};

// One JSON document per outcome.
class StreamReporter final : public OutcomeReporter {
public:
    explicit StreamReporter(std::ostream& out, int indent = 2) : out_(out), indent_(indent) {}
    void report(const transfer::model::TaskOutcome& outcome) override;

private:
    std::ostream& out_;
    int indent_;
    std::mutex mutex_;
};

// Summary line per outcome on the task logger.
class LogReporter final : public OutcomeReporter {
public:
    void report(const transfer::model::TaskOutcome& outcome) override;
};

}
