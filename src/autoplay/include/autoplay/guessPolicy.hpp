#pragma once

#include "model/probabilityGrid.hpp"

#include <functional>
#include <optional>
#include <stdexcept>

namespace mines {

//! Picks the cell to open when no cell is known to be safe.
//! Only uncertain values (strictly between 0 and 1) are candidates. Returns nullopt if there are none.
using GuessPolicy = std::function<std::optional<Coord>(const ProbabilityGrid&)>;

//! Lowest probability; ties go to a corner, then an edge, then the lexicographically smallest cell.
//! Border cells have fewer neighbours and keep the constraints the engine has to solve smaller.
std::optional<Coord> cornerThenEdgePolicy(const ProbabilityGrid& grid);

//! Lowest probability; ties go to the lexicographically smallest cell.
std::optional<Coord> firstMinimumPolicy(const ProbabilityGrid& grid);

//! The controller asked for a guess although there was nothing to guess.
class NoGuessAvailableError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

} // namespace mines
