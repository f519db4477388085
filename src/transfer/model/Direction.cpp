#include "transfer/model/Direction.hpp"

#include <stdexcept>

namespace pt::transfer::model {

std::string to_string(const Direction d) {
    return d == Direction::ToLocal ? "ToLocal" : "ToRemote";
}

std::string to_string(const Phase p) {
    return p == Phase::Pre ? "pre" : "post";
}

Direction direction_from_string(const std::string& str) {
    if (str == "ToLocal" || str == "to_local" || str == "download") return Direction::ToLocal;
    if (str == "ToRemote" || str == "to_remote" || str == "upload") return Direction::ToRemote;
    throw std::invalid_argument("Unknown transfer direction: " + str);
}

}
