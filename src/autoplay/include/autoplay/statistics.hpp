#pragma once

namespace mines {

struct SessionStats {
	unsigned games{0};         //!< Finished games (won or lost).
	unsigned wins{0};          //!< Won games.
	double expectedWins{0.0};  //!< Sum of the per game expected win values.
	unsigned discarded{0};     //!< Games dropped after an inconsistent grid. Not part of the rates.

	double realizedWinRate() const; //!< wins / games, 0 without games.
	double expectedWinRate() const; //!< expectedWins / games, 0 without games.
};

//! Aggregates game outcomes over one autoplay run.
class StatisticsTracker {
public:
	//! \note Throws std::invalid_argument if expectedWin is not within [0, 1].
	SessionStats recordGameEnd(bool won, double expectedWin);
	SessionStats recordDiscarded();

	const SessionStats& stats() const;

private:
	SessionStats m_stats{};
};

} // namespace mines
