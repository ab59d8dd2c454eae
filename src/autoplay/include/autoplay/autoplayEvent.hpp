#pragma once

#include "autoplay/action.hpp"
#include "autoplay/gameResult.hpp"
#include "autoplay/statistics.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace mines {

//! Types of notifications. Used as subscription mask.
enum AutoplaySignal : uint64_t {
	AS_None          = 0,
	AS_GameStarted   = 1 << 0, //!< Fresh board was dealt.
	AS_ActionsIssued = 1 << 1, //!< A step sent actions to the game session.
	AS_GameFinished  = 1 << 2, //!< Game ended. Carries the updated statistics.
	AS_All           = AS_GameStarted | AS_ActionsIssued | AS_GameFinished,
};

struct GameStartedEvent {
	unsigned gameIndex; //!< Zero based index within the run.
};
struct ActionsIssuedEvent {
	std::vector<Action> actions;
	double bestProbability;
};
struct GameFinishedEvent {
	GameResult result;
	SessionStats stats;
};

using AutoplayEvent = std::variant<GameStartedEvent, ActionsIssuedEvent, GameFinishedEvent>;

AutoplaySignal signalOf(const AutoplayEvent& event);

} // namespace mines
