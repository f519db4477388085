#pragma once

#include <stdexcept>
#include <string>

namespace pt::transfer::model {

enum class ErrorKind {
    SchemeMismatch,         // locator does not fit the bound strategy (construction time)
    AuthenticationFailure,
    ObjectNotFound,
    NetworkTimeout,
    LocalIOFailure,
    PathUnresolved,         // local path not absolute (construction time)
    AuthorConflict,         // two specs share a destination within one phase
    TaskBodyFailure,
    TransportFailure,       // any other network / remote-side failure
    Cancelled,
    UnsupportedOperation    // e.g. upload through a read-only strategy
};

std::string to_string(ErrorKind kind);
ErrorKind error_kind_from_string(const std::string& str);

// Construction-time kinds abort an invocation before any transfer starts.
[[nodiscard]] bool isConstructionError(ErrorKind kind);

}

namespace pt::transfer {

class TransferError : public std::runtime_error {
public:
    TransferError(model::ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] model::ErrorKind kind() const noexcept { return kind_; }

private:
    model::ErrorKind kind_;
};

}
