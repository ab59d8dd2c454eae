#include "autoplay/guessPolicy.hpp"

#include <algorithm>
#include <vector>

namespace mines {

//! All cells sharing the lowest uncertain probability.
static std::vector<Coord> lowestCells(const ProbabilityGrid& grid) {
	std::vector<Coord> tied;
	double lowest = 1.0;

	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const auto& p = grid.at({x, y});
			if (!isUncertain(p))
				continue;

			if (*p < lowest) {
				lowest = *p;
				tied.clear();
			}
			if (*p == lowest)
				tied.push_back({x, y});
		}
	}
	return tied;
}

//! 0 for corners, 1 for edges, 2 for inner cells.
static int borderRank(const ProbabilityGrid& grid, const Coord c) {
	const bool xBorder = c.x == 0 || c.x + 1 == grid.width();
	const bool yBorder = c.y == 0 || c.y + 1 == grid.height();
	if (xBorder && yBorder)
		return 0;
	if (xBorder || yBorder)
		return 1;
	return 2;
}

std::optional<Coord> cornerThenEdgePolicy(const ProbabilityGrid& grid) {
	const auto tied = lowestCells(grid);
	if (tied.empty())
		return std::nullopt;

	return *std::min_element(tied.begin(), tied.end(), [&](const Coord a, const Coord b) {
		const auto rankA = borderRank(grid, a);
		const auto rankB = borderRank(grid, b);
		return rankA != rankB ? rankA < rankB : lexicographicLess(a, b);
	});
}

std::optional<Coord> firstMinimumPolicy(const ProbabilityGrid& grid) {
	const auto tied = lowestCells(grid);
	if (tied.empty())
		return std::nullopt;

	return *std::min_element(tied.begin(), tied.end(), lexicographicLess);
}

} // namespace mines
