#pragma once

#include "autoplay/verifier.hpp"

#include <chrono>

namespace mines {

//! How the autoplayer reacts to an inconsistent probability grid.
enum class FailureAction {
	Abort,   //!< Stop the whole run.
	Restart, //!< Discard the current game and start a new one.
	Continue //!< Log and keep playing with the grid.
};

struct VerificationPolicy {
	FailureAction outOfRange{FailureAction::Abort};
	FailureAction noValidGuessBound{FailureAction::Abort};
	FailureAction globalSumMismatch{FailureAction::Abort};
	FailureAction localSumMismatch{FailureAction::Abort};

	FailureAction actionFor(InconsistencyKind kind) const;

	//! Same action for every kind.
	static VerificationPolicy uniform(FailureAction action);
};

struct AutoplayConfig {
	std::chrono::milliseconds stepDelay{1000}; //!< Pause after every step so play can be followed.
	std::chrono::milliseconds gameDelay{5000}; //!< Pause between games.
	unsigned maxGames{0};                      //!< Stop after this many games. 0 runs until cancelled.

	Tolerance tolerance{};
	VerificationPolicy verification{};
};

const char* toString(FailureAction action);

} // namespace mines
