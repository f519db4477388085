#include "transfer/model/Error.hpp"

namespace pt::transfer::model {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SchemeMismatch: return "SchemeMismatch";
    case ErrorKind::AuthenticationFailure: return "AuthenticationFailure";
    case ErrorKind::ObjectNotFound: return "ObjectNotFound";
    case ErrorKind::NetworkTimeout: return "NetworkTimeout";
    case ErrorKind::LocalIOFailure: return "LocalIOFailure";
    case ErrorKind::PathUnresolved: return "PathUnresolved";
    case ErrorKind::AuthorConflict: return "AuthorConflict";
    case ErrorKind::TaskBodyFailure: return "TaskBodyFailure";
    case ErrorKind::TransportFailure: return "TransportFailure";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
    }
    return "TransportFailure";
}

ErrorKind error_kind_from_string(const std::string& str) {
    if (str == "SchemeMismatch") return ErrorKind::SchemeMismatch;
    if (str == "AuthenticationFailure") return ErrorKind::AuthenticationFailure;
    if (str == "ObjectNotFound") return ErrorKind::ObjectNotFound;
    if (str == "NetworkTimeout") return ErrorKind::NetworkTimeout;
    if (str == "LocalIOFailure") return ErrorKind::LocalIOFailure;
    if (str == "PathUnresolved") return ErrorKind::PathUnresolved;
    if (str == "AuthorConflict") return ErrorKind::AuthorConflict;
    if (str == "TaskBodyFailure") return ErrorKind::TaskBodyFailure;
    if (str == "TransportFailure") return ErrorKind::TransportFailure;
    if (str == "Cancelled") return ErrorKind::Cancelled;
    if (str == "UnsupportedOperation") return ErrorKind::UnsupportedOperation;
    throw std::invalid_argument("Unknown error kind: " + str);
}

bool isConstructionError(const ErrorKind kind) {
    return kind == ErrorKind::SchemeMismatch ||
           kind == ErrorKind::PathUnresolved ||
           kind == ErrorKind::UnsupportedOperation;
}

}
