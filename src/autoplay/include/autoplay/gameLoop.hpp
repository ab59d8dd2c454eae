#pragma once

#include "autoplay/action.hpp"
#include "autoplay/autoplayConfig.hpp"
#include "autoplay/cancellationToken.hpp"
#include "autoplay/eventHub.hpp"
#include "autoplay/gameResult.hpp"
#include "autoplay/guessPolicy.hpp"
#include "autoplay/pacer.hpp"
#include "model/IGameSession.hpp"
#include "model/IProbabilityEngine.hpp"

#include <optional>
#include <vector>

namespace mines {

enum class LoopState {
	AwaitingProbabilities,
	AutoResolving, //!< Flagging certain mines.
	Verifying,
	Guessing, //!< Revealing the best uncertain cell.
	Opening,  //!< Revealing all certain safe cells.
	Won,
	Lost,
	Cancelled,
	Failed //!< Stopped by an inconsistent grid.
};

bool isTerminal(LoopState state);
const char* toString(LoopState state);

//! What a single step did.
struct StepReport {
	std::vector<Action> actions{};
	std::optional<double> bestProbability{}; //!< Lowest probability among hidden cells, unset if the step made no decision.
	std::optional<Inconsistency> inconsistency{};
	LoopState state{LoopState::AwaitingProbabilities}; //!< State after the step.
};

//! Plays one game on the session by converting engine probabilities into actions.
//! Every step: flag certain mines, verify the grid, then either open all safe cells or take the best guess.
class GameLoopController {
public:
	GameLoopController(IGameSession& session, IProbabilityEngine& engine, const CancellationToken& token, IPacer& pacer,
	                   AutoplayConfig config = {}, GuessPolicy policy = cornerThenEdgePolicy, EventHub* eventHub = nullptr);

	//! Prepare for a new game. The session has to be reset by the caller.
	void begin();

	//! Run a single step. Returns immediately once the game reached a terminal state.
	//! \note Throws NoGuessAvailableError if nothing can be revealed; engine and session exceptions pass through.
	StepReport step();

	//! begin() and step until a terminal state is reached.
	GameResult playGame();

	LoopState state() const;
	double expectedWin() const; //!< Running product of (1 - p) over the guesses of this game.
	unsigned steps() const;

	//! Result of the game so far; the outcome is only meaningful in a terminal state.
	GameResult result() const;

private:
	LoopState settle() const; //!< Terminal state reported by session and token, or AwaitingProbabilities.

	void autoResolve(const ProbabilityGrid& grid, std::vector<Action>& actions);
	void guess(const ProbabilityGrid& candidates, double bestProbability, std::vector<Action>& actions);
	void openSafe(const ProbabilityGrid& candidates, std::vector<Action>& actions);

private:
	IGameSession& m_session;
	IProbabilityEngine& m_engine;
	const CancellationToken& m_token;
	IPacer& m_pacer;

	AutoplayConfig m_config;
	GuessPolicy m_policy;
	EventHub* m_eventHub; //!< Optional. Receives ActionsIssued events.

	LoopState m_state{LoopState::AwaitingProbabilities};
	double m_expectedWin{1.0};
	unsigned m_steps{0};

	std::optional<Inconsistency> m_failure{};
	FailureAction m_failureAction{FailureAction::Abort};
};

} // namespace mines
