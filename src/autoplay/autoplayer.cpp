#include "autoplay/autoplayer.hpp"

#include "logging.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace mines {

Autoplayer::Autoplayer(IGameSession& session, IProbabilityEngine& engine, CancellationToken& token, IPacer& pacer, AutoplayConfig config,
                       GuessPolicy policy)
    : m_session(session), m_token(token), m_pacer(pacer), m_config(config),
      m_controller(session, engine, token, pacer, std::move(config), std::move(policy), &m_eventHub) {
}

Autoplayer::~Autoplayer() {
	if (m_worker.joinable()) {
		m_token.cancel();
		m_worker.join();
	}
}

void Autoplayer::subscribe(IAutoplayListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Autoplayer::unsubscribe(IAutoplayListener* listener) {
	m_eventHub.unsubscribe(listener);
}

RunReport Autoplayer::run() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[Autoplayer] Run started.");
	logger.Flush();

	RunReport report;
	unsigned gameIndex = 0;
	while (!m_token.isCancelled()) {
		if (gameLimitReached()) {
			report.outcome = RunOutcome::Completed;
			break;
		}

		m_session.reset();
		m_eventHub.signal(GameStartedEvent{gameIndex++});

		const auto result = m_controller.playGame();
		if (result.outcome == GameOutcome::Cancelled)
			break;

		if (result.outcome == GameOutcome::Aborted) {
			report.outcome = RunOutcome::Aborted;
			report.failure = result.failure;
			logger.Log(Logging::LogLevel::Error, "[Autoplayer] Run aborted after " + std::to_string(m_tracker.stats().games) + " games.");
			break;
		}

		const auto stats = result.outcome == GameOutcome::Restarted ? m_tracker.recordDiscarded()
		                                                            : m_tracker.recordGameEnd(result.outcome == GameOutcome::Won, result.expectedWin);
		logSummary(result, stats);
		m_eventHub.signal(GameFinishedEvent{result, stats});

		m_pacer.afterGame();
	}

	report.stats = m_tracker.stats();
	logger.Log(Logging::LogLevel::Info, std::string("[Autoplayer] Run stopped (") + toString(report.outcome) + ").");
	logger.Flush();
	return report;
}

void Autoplayer::start() {
	if (m_worker.joinable()) {
		Logger().Log(Logging::LogLevel::Warning, "[Autoplayer] Worker already running. Start ignored.");
		return;
	}

	m_workerError = nullptr;
	m_worker      = std::thread([this] {
		try {
			m_workerReport = run();
		} catch (const std::exception& ex) {
			Logger().Log(Logging::LogLevel::Error, std::string("[Autoplayer] Worker stopped by exception: ") + ex.what());
			m_workerError = std::current_exception();
		} catch (...) {
			Logger().Log(Logging::LogLevel::Error, "[Autoplayer] Worker stopped by unknown exception.");
			m_workerError = std::current_exception();
		}
	});
}

RunReport Autoplayer::join() {
	if (m_worker.joinable()) {
		m_worker.join();
	}
	if (m_workerError) {
		std::rethrow_exception(std::exchange(m_workerError, nullptr));
	}
	return m_workerReport;
}

const SessionStats& Autoplayer::stats() const {
	return m_tracker.stats();
}

bool Autoplayer::gameLimitReached() const {
	const auto& stats = m_tracker.stats();
	return m_config.maxGames != 0u && stats.games + stats.discarded >= m_config.maxGames;
}

void Autoplayer::logSummary(const GameResult& result, const SessionStats& stats) const {
	if (result.outcome == GameOutcome::Restarted) {
		Logger().Log(Logging::LogLevel::Warning, "[Autoplayer] Game discarded after " + std::to_string(result.steps) +
		                                                 " steps. Discarded games = " + std::to_string(stats.discarded));
		return;
	}

	std::ostringstream line;
	line << std::setprecision(3);
	line << "[Autoplayer] " << (result.outcome == GameOutcome::Won ? 'W' : 'L') << " | E[GameWin%] = " << result.expectedWin
	     << ", Wins = " << stats.wins << ", Games = " << stats.games << ", E[Wins] = " << stats.expectedWins << ", Win% = " << std::fixed
	     << stats.realizedWinRate() * 100.0 << "%";
	Logger().Log(Logging::LogLevel::Info, line.str());
}

const char* toString(const RunOutcome outcome) {
	switch (outcome) {
	case RunOutcome::Cancelled:
		return "Cancelled";
	case RunOutcome::Completed:
		return "Completed";
	case RunOutcome::Aborted:
		return "Aborted";
	}
	return "Unknown";
}

} // namespace mines
