#pragma once

#include "model/types.hpp"

#include <variant>

namespace mines {

struct FlagAction {
	Coord c;
	bool operator==(const FlagAction&) const = default;
};
struct RevealAction {
	Coord c;
	bool operator==(const RevealAction&) const = default;
};

//! Board action issued by the autoplayer to the game session.
using Action = std::variant<FlagAction, RevealAction>;

} // namespace mines
