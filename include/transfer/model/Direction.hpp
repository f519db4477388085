#pragma once

#include <string>

namespace pt::transfer::model {

enum class Direction { ToLocal, ToRemote };
enum class Phase { Pre, Post };

// ToLocal specs run only before the task body, ToRemote only after it.
constexpr Phase phaseOf(const Direction d) { return d == Direction::ToLocal ? Phase::Pre : Phase::Post; }

std::string to_string(Direction d);
std::string to_string(Phase p);
Direction direction_from_string(const std::string& str);

}
