#pragma once

#include <memory>
#include <variant>

namespace pt::transfer::model { struct TransferResult; }

typedef std::variant<bool, std::shared_ptr<pt::transfer::model::TransferResult>> ExpectedFuture;
