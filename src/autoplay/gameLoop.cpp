#include "autoplay/gameLoop.hpp"

#include "autoplay/verifier.hpp"
#include "logging.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace mines {

//! Copy of the grid holding only the cells that can still be opened.
static ProbabilityGrid hiddenCells(const ProbabilityGrid& grid, const BoardState& board) {
	ProbabilityGrid hidden(grid.width(), grid.height());
	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			if (board.at({x, y}).isHidden())
				hidden.set({x, y}, grid.at({x, y}));
		}
	}
	return hidden;
}

//! Lowest certain-safe or uncertain value in the grid. Out of range values are never a candidate.
static std::optional<double> lowestProbability(const ProbabilityGrid& grid) {
	std::optional<double> lowest;
	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const auto& p = grid.at({x, y});
			if ((isCertainSafe(p) || isUncertain(p)) && (!lowest || *p < *lowest))
				lowest = *p;
		}
	}
	return lowest;
}

static std::string percent(const double probability) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(4) << probability * 100.0 << "%";
	return out.str();
}

static std::string coordString(const Coord c) {
	return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}

GameLoopController::GameLoopController(IGameSession& session, IProbabilityEngine& engine, const CancellationToken& token, IPacer& pacer,
                                       AutoplayConfig config, GuessPolicy policy, EventHub* eventHub)
    : m_session(session), m_engine(engine), m_token(token), m_pacer(pacer), m_config(std::move(config)), m_policy(std::move(policy)),
      m_eventHub(eventHub) {
	if (!m_policy) {
		throw std::invalid_argument("GameLoopController: guess policy must be callable.");
	}
}

void GameLoopController::begin() {
	m_state         = LoopState::AwaitingProbabilities;
	m_expectedWin   = 1.0;
	m_steps         = 0u;
	m_failure       = std::nullopt;
	m_failureAction = FailureAction::Abort;

	Logger().Log(Logging::LogLevel::Info, "[GameLoop] Game started on " + std::to_string(m_session.width()) + "x" +
	                                              std::to_string(m_session.height()) + " board with " +
	                                              std::to_string(m_session.numMines()) + " mines.");
}

StepReport GameLoopController::step() {
	StepReport report;
	if (isTerminal(m_state)) {
		report.state = m_state;
		return report;
	}
	if (const auto terminal = settle(); isTerminal(terminal)) {
		m_state      = terminal;
		report.state = m_state;
		return report;
	}

	m_state         = LoopState::AwaitingProbabilities;
	const auto grid = m_engine.solve(m_session.state());
	if (!grid.sameShape(m_session.width(), m_session.height())) {
		throw std::invalid_argument("GameLoopController: engine returned a " + std::to_string(grid.width()) + "x" +
		                            std::to_string(grid.height()) + " grid for a " + std::to_string(m_session.width()) + "x" +
		                            std::to_string(m_session.height()) + " board.");
	}

	m_state = LoopState::AutoResolving;
	autoResolve(grid, report.actions);

	// Verified against the board with the new flags applied; minesRemaining already accounts for them.
	m_state = LoopState::Verifying;
	if (auto failure = verifyProbabilities(m_session.state(), grid, m_session.minesRemaining(), m_config.tolerance)) {
		const auto action    = m_config.verification.actionFor(failure->kind);
		report.inconsistency = failure;

		if (action == FailureAction::Continue) {
			Logger().Log(Logging::LogLevel::Warning, "[GameLoop] Ignoring inconsistent probabilities. " + describe(*failure));
		} else {
			Logger().Log(Logging::LogLevel::Error,
			             std::string("[GameLoop] Inconsistent probabilities (") + toString(action) + "). " + describe(*failure));
			m_failure       = std::move(failure);
			m_failureAction = action;
			m_state         = LoopState::Failed;
			report.state    = m_state;
			return report;
		}
	}

	const auto candidates = hiddenCells(grid, m_session.state());
	const auto best       = lowestProbability(candidates);
	if (!best) {
		throw NoGuessAvailableError("GameLoopController: no hidden cell below probability 1 left to reveal.");
	}
	report.bestProbability = best;

	if (*best != 0.0) {
		m_state = LoopState::Guessing;
		guess(candidates, *best, report.actions);
	} else {
		m_state = LoopState::Opening;
		openSafe(candidates, report.actions);
	}
	++m_steps;

	if (m_eventHub) {
		m_eventHub->signal(ActionsIssuedEvent{report.actions, *best});
	}
	m_pacer.afterStep();

	m_state      = settle();
	report.state = m_state;
	return report;
}

GameResult GameLoopController::playGame() {
	begin();
	while (!isTerminal(m_state)) {
		step();
	}
	return result();
}

LoopState GameLoopController::state() const {
	return m_state;
}

double GameLoopController::expectedWin() const {
	return m_expectedWin;
}

unsigned GameLoopController::steps() const {
	return m_steps;
}

GameResult GameLoopController::result() const {
	GameOutcome outcome = GameOutcome::Cancelled;
	switch (m_state) {
	case LoopState::Won:
		outcome = GameOutcome::Won;
		break;
	case LoopState::Lost:
		outcome = GameOutcome::Lost;
		break;
	case LoopState::Failed:
		outcome = m_failureAction == FailureAction::Restart ? GameOutcome::Restarted : GameOutcome::Aborted;
		break;
	default:
		break;
	}
	return {outcome, m_expectedWin, m_steps, m_failure};
}

LoopState GameLoopController::settle() const {
	if (m_session.done())
		return m_session.isWon() ? LoopState::Won : LoopState::Lost;
	if (m_token.isCancelled())
		return LoopState::Cancelled;
	return LoopState::AwaitingProbabilities;
}

void GameLoopController::autoResolve(const ProbabilityGrid& grid, std::vector<Action>& actions) {
	const auto before = actions.size();
	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const Coord c{x, y};
			// Snapshot is re-read per cell; flagging changes the session state.
			if (isCertainMine(grid.at(c)) && m_session.state().at(c).isHidden()) {
				m_session.flag(c);
				actions.push_back(FlagAction{c});
			}
		}
	}

	if (actions.size() != before) {
		Logger().Log(Logging::LogLevel::Debug, "[GameLoop] Flagged " + std::to_string(actions.size() - before) + " certain mines.");
	}
}

void GameLoopController::guess(const ProbabilityGrid& candidates, const double bestProbability, std::vector<Action>& actions) {
	const auto target = m_policy(candidates);
	if (!target) {
		throw NoGuessAvailableError("GameLoopController: guess policy found no uncertain cell.");
	}

	m_expectedWin *= 1.0 - bestProbability;
	Logger().Log(Logging::LogLevel::Info, "[GameLoop] GUESS (" + percent(bestProbability) + ") " + coordString(*target));

	m_session.reveal(*target);
	actions.push_back(RevealAction{*target});
}

void GameLoopController::openSafe(const ProbabilityGrid& candidates, std::vector<Action>& actions) {
	const auto before = actions.size();
	for (Id y = 0; y < candidates.height(); ++y) {
		for (Id x = 0; x < candidates.width(); ++x) {
			const Coord c{x, y};
			if (!isCertainSafe(candidates.at(c)))
				continue;

			m_session.reveal(c);
			actions.push_back(RevealAction{c});
			if (m_session.done())
				break;
		}
		if (m_session.done())
			break;
	}

	Logger().Log(Logging::LogLevel::Debug, "[GameLoop] Opened " + std::to_string(actions.size() - before) + " safe cells.");
}

bool isTerminal(const LoopState state) {
	switch (state) {
	case LoopState::Won:
	case LoopState::Lost:
	case LoopState::Cancelled:
	case LoopState::Failed:
		return true;
	default:
		return false;
	}
}

const char* toString(const LoopState state) {
	switch (state) {
	case LoopState::AwaitingProbabilities:
		return "AwaitingProbabilities";
	case LoopState::AutoResolving:
		return "AutoResolving";
	case LoopState::Verifying:
		return "Verifying";
	case LoopState::Guessing:
		return "Guessing";
	case LoopState::Opening:
		return "Opening";
	case LoopState::Won:
		return "Won";
	case LoopState::Lost:
		return "Lost";
	case LoopState::Cancelled:
		return "Cancelled";
	case LoopState::Failed:
		return "Failed";
	}
	return "Unknown";
}

const char* toString(const GameOutcome outcome) {
	switch (outcome) {
	case GameOutcome::Won:
		return "Won";
	case GameOutcome::Lost:
		return "Lost";
	case GameOutcome::Cancelled:
		return "Cancelled";
	case GameOutcome::Restarted:
		return "Restarted";
	case GameOutcome::Aborted:
		return "Aborted";
	}
	return "Unknown";
}

} // namespace mines
