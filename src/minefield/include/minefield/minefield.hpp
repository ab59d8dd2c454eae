#pragma once

#include "model/IGameSession.hpp"
#include "model/grid.hpp"

#include <cstdint>
#include <optional>
#include <random>

namespace mines {

struct MinefieldConfig {
	std::size_t width{9u};
	std::size_t height{9u};
	unsigned numMines{10u};
	bool firstNeverMine{true}; //!< Defer mine placement to the first reveal so it never hits a mine.

	static MinefieldConfig beginner();
	static MinefieldConfig intermediate();
	static MinefieldConfig expert();
};

//! In-memory minesweeper game.
class Minefield : public IGameSession {
public:
	//! Throws std::invalid_argument if the mines do not fit on the board.
	Minefield(const MinefieldConfig& config, std::uint64_t seed);

	std::size_t width() const override;
	std::size_t height() const override;
	unsigned numMines() const override;
	int minesRemaining() const override;

	const BoardState& state() const override;

	bool done() const override;
	bool isWon() const override;

	void reset() override;
	bool reveal(Coord c) override;
	bool flag(Coord c) override;

	//! True if a mine is placed at c. Mines are only placed after the first reveal with firstNeverMine.
	bool hasMine(Coord c) const;

private:
	void checkBounds(Coord c) const;
	void placeMines(std::optional<Coord> excluded);
	unsigned adjacentMines(Coord c) const;
	void floodReveal(Coord start);

private:
	MinefieldConfig m_config;
	std::mt19937_64 m_rng;

	BoardState m_state;           //!< What the player sees.
	Grid<std::uint8_t> m_mines{}; //!< Hidden layout. Non zero marks a mine.

	bool m_minesPlaced{false};
	bool m_lost{false};
	std::size_t m_flags{0};
	std::size_t m_hiddenSafe{0}; //!< Safe cells not yet revealed. Zero means won.
};

} // namespace mines
