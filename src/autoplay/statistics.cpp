#include "autoplay/statistics.hpp"

#include <stdexcept>
#include <string>

namespace mines {

double SessionStats::realizedWinRate() const {
	return games == 0 ? 0.0 : static_cast<double>(wins) / static_cast<double>(games);
}

double SessionStats::expectedWinRate() const {
	return games == 0 ? 0.0 : expectedWins / static_cast<double>(games);
}

SessionStats StatisticsTracker::recordGameEnd(const bool won, const double expectedWin) {
	if (!(0.0 <= expectedWin && expectedWin <= 1.0)) {
		throw std::invalid_argument("StatisticsTracker: expected win " + std::to_string(expectedWin) + " is not a probability.");
	}

	++m_stats.games;
	if (won)
		++m_stats.wins;
	m_stats.expectedWins += expectedWin;
	return m_stats;
}

SessionStats StatisticsTracker::recordDiscarded() {
	++m_stats.discarded;
	return m_stats;
}

const SessionStats& StatisticsTracker::stats() const {
	return m_stats;
}

} // namespace mines
