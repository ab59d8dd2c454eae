#pragma once

#include "model/grid.hpp"

namespace mines {

//! What the player currently sees of a single cell.
struct Cell {
	enum class Kind {
		Unrevealed, //!< Hidden and unmarked.
		Flagged,    //!< Hidden and marked as mine.
		Revealed    //!< Open. Carries the adjacent mine count.
	};

	Kind kind{Kind::Unrevealed};
	unsigned adjacentMines{0}; //!< Only meaningful for revealed cells.

	static constexpr Cell unrevealed() { return {Kind::Unrevealed, 0u}; }
	static constexpr Cell flagged() { return {Kind::Flagged, 0u}; }
	static constexpr Cell revealed(unsigned count) { return {Kind::Revealed, count}; }

	bool isRevealed() const { return kind == Kind::Revealed; }
	bool isFlagged() const { return kind == Kind::Flagged; }
	bool isHidden() const { return kind == Kind::Unrevealed; }

	bool operator==(const Cell&) const = default;
};

using BoardState = Grid<Cell>;

//! Number of flagged cells on the board.
std::size_t countFlags(const BoardState& board);

} // namespace mines
