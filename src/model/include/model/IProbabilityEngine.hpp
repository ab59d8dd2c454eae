#pragma once

#include "model/boardState.hpp"
#include "model/probabilityGrid.hpp"

namespace mines {

//! Computes the mine probability of every cell from what is visible on the board.
class IProbabilityEngine {
public:
	virtual ~IProbabilityEngine() = default;

	//! Returned grid must have the board's shape. May be expensive; called once per autoplay step.
	virtual ProbabilityGrid solve(const BoardState& board) = 0;
};

} // namespace mines
