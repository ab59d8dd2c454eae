#pragma once

#include "autoplay/IAutoplayListener.hpp"
#include "autoplay/autoplayConfig.hpp"
#include "autoplay/cancellationToken.hpp"
#include "autoplay/eventHub.hpp"
#include "autoplay/gameLoop.hpp"
#include "autoplay/statistics.hpp"

#include <exception>
#include <optional>
#include <thread>

namespace mines {

enum class RunOutcome {
	Cancelled, //!< Quit requested.
	Completed, //!< Configured number of games played.
	Aborted    //!< Inconsistent grid with an Abort policy.
};

struct RunReport {
	RunOutcome outcome{RunOutcome::Cancelled};
	SessionStats stats{};
	std::optional<Inconsistency> failure{};
};

//! Plays games back to back until cancelled, tracking win statistics.
//! Owns the worker thread; the token is the only state shared with the thread that requests the quit.
class Autoplayer {
public:
	Autoplayer(IGameSession& session, IProbabilityEngine& engine, CancellationToken& token, IPacer& pacer,
	           AutoplayConfig config = {}, GuessPolicy policy = cornerThenEdgePolicy);
	~Autoplayer(); //!< Cancels and joins a running worker.

	void subscribe(IAutoplayListener* listener, uint64_t signalMask);
	void unsubscribe(IAutoplayListener* listener);

	//! Play games on the calling thread until cancelled, maxGames is reached or a grid check aborts the run.
	//! \note Engine and session exceptions pass through.
	RunReport run();

	void start();     //!< Run on a dedicated worker thread.
	RunReport join(); //!< Wait for the worker. Rethrows an exception that ended it.

	//! \note Only safe to read from listeners or while no worker is running.
	const SessionStats& stats() const;

private:
	bool gameLimitReached() const;
	void logSummary(const GameResult& result, const SessionStats& stats) const;

private:
	IGameSession& m_session;
	CancellationToken& m_token;
	IPacer& m_pacer;
	AutoplayConfig m_config;

	EventHub m_eventHub;
	GameLoopController m_controller;
	StatisticsTracker m_tracker;

	std::thread m_worker;
	RunReport m_workerReport{};
	std::exception_ptr m_workerError{};
};

const char* toString(RunOutcome outcome);

} // namespace mines
