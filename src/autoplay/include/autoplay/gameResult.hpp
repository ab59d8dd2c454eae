#pragma once

#include "autoplay/verifier.hpp"

#include <optional>

namespace mines {

enum class GameOutcome {
	Won,
	Lost,
	Cancelled, //!< Quit requested before the game finished.
	Restarted, //!< Inconsistent grid; game discarded per policy.
	Aborted    //!< Inconsistent grid; run stops per policy.
};

struct GameResult {
	GameOutcome outcome;
	double expectedWin{1.0}; //!< Product of (1 - p) over all guesses taken.
	unsigned steps{0};
	std::optional<Inconsistency> failure{};
};

const char* toString(GameOutcome outcome);

} // namespace mines
