#include "autoplay/gameLoop.hpp"
#include "autoplay/statistics.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace mines::gtest {

static std::size_t countReveals(const std::vector<Action>& actions) {
	std::size_t reveals = 0;
	for (const auto& action: actions) {
		if (std::holds_alternative<RevealAction>(action))
			++reveals;
	}
	return reveals;
}

class ActionCounter : public IAutoplayListener {
public:
	void onAutoplayEvent(const AutoplayEvent& event) override {
		if (const auto* issued = std::get_if<ActionsIssuedEvent>(&event)) {
			actions += issued->actions.size();
			++events;
		}
	}
	std::size_t actions{0};
	unsigned events{0};
};

TEST(GameLoop, UniformGridGuessesOnce) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	const auto report = controller.step();

	EXPECT_FALSE(report.inconsistency);
	ASSERT_EQ(report.actions.size(), 1u);
	EXPECT_EQ(std::get<RevealAction>(report.actions[0]).c, (Coord{0u, 0u}));
	EXPECT_EQ(session.actions, report.actions);
	ASSERT_TRUE(report.bestProbability);
	EXPECT_DOUBLE_EQ(*report.bestProbability, 1.0 / 9.0);
	EXPECT_DOUBLE_EQ(controller.expectedWin(), 8.0 / 9.0);
	EXPECT_EQ(report.state, LoopState::AwaitingProbabilities);
	EXPECT_EQ(controller.steps(), 1u);
}

TEST(GameLoop, CertainSafeCellsAreOpenedTogether) {
	FakeSession session(3u, 3u, 1u);
	auto grid = uniformGrid(3u, 3u, 1.0 / 6.0);
	grid.set({0u, 0u}, 0.0);
	grid.set({2u, 1u}, 0.0);
	grid.set({1u, 2u}, 0.0);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	const auto report = controller.step();

	EXPECT_FALSE(report.inconsistency);
	ASSERT_EQ(report.actions.size(), 3u);
	EXPECT_EQ(countReveals(report.actions), 3u);
	EXPECT_EQ(std::get<RevealAction>(report.actions[0]).c, (Coord{0u, 0u}));
	EXPECT_EQ(std::get<RevealAction>(report.actions[1]).c, (Coord{2u, 1u}));
	EXPECT_EQ(std::get<RevealAction>(report.actions[2]).c, (Coord{1u, 2u}));
	EXPECT_EQ(*report.bestProbability, 0.0);
	EXPECT_EQ(controller.expectedWin(), 1.0);
}

TEST(GameLoop, CertainMinesAreFlaggedBeforeVerifying) {
	// [1][?][?][?] with one mine: the cell next to the number must be it.
	FakeSession session(4u, 1u, 1u);
	session.setCell({0u, 0u}, Cell::revealed(1u));

	ProbabilityGrid grid(4u, 1u);
	grid.set({1u, 0u}, 1.0);
	grid.set({2u, 0u}, 0.0);
	grid.set({3u, 0u}, 0.0);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	const auto report = controller.step();

	EXPECT_FALSE(report.inconsistency);
	const std::vector<Action> expected{FlagAction{{1u, 0u}}, RevealAction{{2u, 0u}}, RevealAction{{3u, 0u}}};
	EXPECT_EQ(report.actions, expected);
	EXPECT_EQ(session.minesRemaining(), 0);
}

TEST(GameLoop, FlaggedMinesAreNotFlaggedAgain) {
	FakeSession session(4u, 1u, 1u);
	session.setCell({0u, 0u}, Cell::revealed(1u));
	session.setCell({1u, 0u}, Cell::flagged());

	ProbabilityGrid grid(4u, 1u);
	grid.set({1u, 0u}, 1.0);
	grid.set({2u, 0u}, 0.0);
	grid.set({3u, 0u}, 0.0);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	const auto report = controller.step();
	EXPECT_EQ(report.actions.size(), 2u);
	EXPECT_EQ(countReveals(report.actions), 2u);
}

TEST(GameLoop, InconsistencyAbortsByDefault) {
	FakeSession session(3u, 3u, 1u);
	auto grid = uniformGrid(3u, 3u, 1.0 / 9.0);
	grid.set({1u, 1u}, 0.5);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	const auto result = controller.playGame();

	EXPECT_EQ(result.outcome, GameOutcome::Aborted);
	ASSERT_TRUE(result.failure);
	EXPECT_EQ(result.failure->kind, InconsistencyKind::GlobalSumMismatch);
	EXPECT_TRUE(session.actions.empty());
	EXPECT_EQ(controller.state(), LoopState::Failed);
	EXPECT_EQ(engine.calls, 1u);
}

TEST(GameLoop, RestartPolicyDiscardsGame) {
	FakeSession session(3u, 3u, 1u);
	auto grid = uniformGrid(3u, 3u, 1.0 / 9.0);
	grid.set({0u, 0u}, 1.5);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	AutoplayConfig config;
	config.verification.outOfRange = FailureAction::Restart;
	GameLoopController controller(session, engine, token, pacer, config);

	const auto result = controller.playGame();
	EXPECT_EQ(result.outcome, GameOutcome::Restarted);
	EXPECT_EQ(result.failure->kind, InconsistencyKind::OutOfRange);
}

TEST(GameLoop, ContinuePolicyKeepsPlaying) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 0.25)});
	CancellationToken token;
	NoPacer pacer;
	AutoplayConfig config;
	config.verification = VerificationPolicy::uniform(FailureAction::Continue);
	GameLoopController controller(session, engine, token, pacer, config);

	controller.begin();
	const auto report = controller.step();

	ASSERT_TRUE(report.inconsistency);
	EXPECT_EQ(report.inconsistency->kind, InconsistencyKind::GlobalSumMismatch);
	EXPECT_EQ(report.actions.size(), 1u);
	EXPECT_DOUBLE_EQ(controller.expectedWin(), 0.75);
	EXPECT_EQ(report.state, LoopState::AwaitingProbabilities);
}

TEST(GameLoop, ContinuePolicyIgnoresOutOfRangeValues) {
	FakeSession session(3u, 3u, 1u);
	auto grid = uniformGrid(3u, 3u, 1.0 / 9.0);
	grid.set({2u, 2u}, -0.5);
	ScriptedEngine engine({grid});
	CancellationToken token;
	NoPacer pacer;
	AutoplayConfig config;
	config.verification = VerificationPolicy::uniform(FailureAction::Continue);
	GameLoopController controller(session, engine, token, pacer, config);

	controller.begin();
	const auto report = controller.step();

	ASSERT_TRUE(report.inconsistency);
	EXPECT_EQ(report.inconsistency->kind, InconsistencyKind::OutOfRange);
	ASSERT_TRUE(report.bestProbability);
	EXPECT_DOUBLE_EQ(*report.bestProbability, 1.0 / 9.0);
	ASSERT_EQ(report.actions.size(), 1u);
	EXPECT_EQ(std::get<RevealAction>(report.actions[0]).c, (Coord{0u, 0u}));
	EXPECT_DOUBLE_EQ(controller.expectedWin(), 8.0 / 9.0);

	session.finish(false);
	controller.step();
	const auto result = controller.result();
	EXPECT_EQ(result.outcome, GameOutcome::Lost);
	EXPECT_GE(result.expectedWin, 0.0);
	EXPECT_LE(result.expectedWin, 1.0);

	StatisticsTracker tracker;
	EXPECT_NO_THROW(tracker.recordGameEnd(false, result.expectedWin));
}

TEST(GameLoop, CancelledBetweenStepsStopsTheGame) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	EXPECT_EQ(controller.step().state, LoopState::AwaitingProbabilities);
	token.cancel();
	const auto report = controller.step();

	EXPECT_EQ(report.state, LoopState::Cancelled);
	EXPECT_TRUE(report.actions.empty());
	EXPECT_EQ(engine.calls, 1u);
	EXPECT_EQ(session.actions.size(), 1u);
	EXPECT_EQ(controller.result().outcome, GameOutcome::Cancelled);
}

TEST(GameLoop, PlaysUntilSessionIsDone) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	controller.step();
	session.finish(true);
	const auto report = controller.step();

	EXPECT_TRUE(report.actions.empty());
	EXPECT_EQ(report.state, LoopState::Won);
	EXPECT_EQ(controller.result().outcome, GameOutcome::Won);
	EXPECT_EQ(engine.calls, 1u);

	// Terminal states are sticky.
	controller.step();
	EXPECT_EQ(engine.calls, 1u);
}

TEST(GameLoop, LostGameReportsExpectedWin) {
	FakeSession session(3u, 3u, 1u);
	session.finish(false);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	const auto result = controller.playGame();
	EXPECT_EQ(result.outcome, GameOutcome::Lost);
	EXPECT_EQ(result.expectedWin, 1.0);
	EXPECT_EQ(engine.calls, 0u);
}

TEST(GameLoop, CancelledBeforeStepDoesNotAskEngine) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	token.cancel();
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	const auto result = controller.playGame();
	EXPECT_EQ(result.outcome, GameOutcome::Cancelled);
	EXPECT_EQ(engine.calls, 0u);
	EXPECT_TRUE(session.actions.empty());
}

TEST(GameLoop, UsesInjectedGuessPolicy) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	unsigned policyCalls = 0;
	GameLoopController controller(session, engine, token, pacer, {}, [&](const ProbabilityGrid&) -> std::optional<Coord> {
		++policyCalls;
		return Coord{1u, 1u};
	});

	controller.begin();
	const auto report = controller.step();
	EXPECT_EQ(policyCalls, 1u);
	EXPECT_EQ(std::get<RevealAction>(report.actions[0]).c, (Coord{1u, 1u}));
}

TEST(GameLoop, PolicyWithoutAnswerIsLogicError) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer, {}, [](const ProbabilityGrid&) { return std::optional<Coord>{}; });

	controller.begin();
	EXPECT_THROW(controller.step(), NoGuessAvailableError);
	EXPECT_EQ(controller.expectedWin(), 1.0);
}

TEST(GameLoop, NothingToRevealIsLogicError) {
	FakeSession session(2u, 1u, 2u);
	ScriptedEngine engine({uniformGrid(2u, 1u, 1.0)});
	CancellationToken token;
	NoPacer pacer;
	AutoplayConfig config;
	config.verification = VerificationPolicy::uniform(FailureAction::Continue);
	GameLoopController controller(session, engine, token, pacer, config);

	controller.begin();
	EXPECT_THROW(controller.step(), NoGuessAvailableError);
}

TEST(GameLoop, MismatchedGridShapeIsRejected) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(4u, 3u, 1.0 / 12.0)});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	EXPECT_THROW(controller.step(), std::invalid_argument);
}

TEST(GameLoop, EngineFailurePropagates) {
	FakeSession session(3u, 3u, 1u);
	ThrowingEngine engine;
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	EXPECT_THROW(controller.playGame(), std::runtime_error);
}

TEST(GameLoop, ActionsAreSignalled) {
	FakeSession session(3u, 3u, 1u);
	ScriptedEngine engine({uniformGrid(3u, 3u, 1.0 / 9.0)});
	CancellationToken token;
	NoPacer pacer;
	EventHub hub;
	ActionCounter counter;
	hub.subscribe(&counter, AS_ActionsIssued);
	// The scripted grid ignores revealed cells, so later steps would fail the neighbour check.
	AutoplayConfig config;
	config.verification = VerificationPolicy::uniform(FailureAction::Continue);
	GameLoopController controller(session, engine, token, pacer, config, cornerThenEdgePolicy, &hub);

	controller.begin();
	controller.step();
	controller.step();
	EXPECT_EQ(counter.events, 2u);
	EXPECT_EQ(counter.actions, 2u);

	hub.unsubscribe(&counter);
	controller.step();
	EXPECT_EQ(counter.events, 2u);
}

TEST(GameLoop, ExpectedWinMultipliesOverGuesses) {
	FakeSession session(2u, 2u, 1u);
	auto second = uniformGrid(2u, 2u, 1.0 / 3.0);
	second.set({0u, 0u}, std::nullopt);
	ScriptedEngine engine({uniformGrid(2u, 2u, 0.25), second});
	CancellationToken token;
	NoPacer pacer;
	GameLoopController controller(session, engine, token, pacer);

	controller.begin();
	controller.step();
	session.setCell({0u, 0u}, Cell::revealed(1u));
	const auto report = controller.step();

	EXPECT_FALSE(report.inconsistency);
	EXPECT_EQ(std::get<RevealAction>(report.actions[0]).c, (Coord{0u, 1u}));
	EXPECT_DOUBLE_EQ(controller.expectedWin(), 0.75 * (2.0 / 3.0));

	controller.begin();
	EXPECT_EQ(controller.expectedWin(), 1.0);
}

} // namespace mines::gtest
