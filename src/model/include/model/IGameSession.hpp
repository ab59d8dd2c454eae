#pragma once

#include "model/boardState.hpp"
#include "model/types.hpp"

#include <cstddef>

namespace mines {

//! A single game of minesweeper the autoplayer acts upon.
//! Actions are processed synchronously; state() reflects them once the call returns.
class IGameSession {
public:
	virtual ~IGameSession() = default;

	virtual std::size_t width() const  = 0;
	virtual std::size_t height() const = 0;
	virtual unsigned numMines() const  = 0;

	//! Total mines minus placed flags. Negative if more flags than mines are placed.
	virtual int minesRemaining() const = 0;

	virtual const BoardState& state() const = 0;

	virtual bool done() const  = 0; //!< Game won or lost.
	virtual bool isWon() const = 0;

	//! Start a fresh game with a new mine layout.
	virtual void reset() = 0;

	//! Open a cell. Returns false if the action had no effect.
	//! \note Throws std::out_of_range for coordinates outside the board.
	virtual bool reveal(Coord c) = 0;

	//! Toggle the flag on a hidden cell. Returns false if the action had no effect.
	//! \note Throws std::out_of_range for coordinates outside the board.
	virtual bool flag(Coord c) = 0;
};

} // namespace mines
