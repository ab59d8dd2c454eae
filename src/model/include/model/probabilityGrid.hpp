#pragma once

#include "model/grid.hpp"

#include <optional>

namespace mines {

//! Mine probability of a cell. Empty if the engine could not determine it (e.g. revealed cells).
using Probability     = std::optional<double>;
using ProbabilityGrid = Grid<Probability>;

inline bool isCertainMine(const Probability& p) {
	return p && *p == 1.0;
}

inline bool isCertainSafe(const Probability& p) {
	return p && *p == 0.0;
}

inline bool isUncertain(const Probability& p) {
	return p && *p > 0.0 && *p < 1.0;
}

} // namespace mines
