#include "autoplay/verifier.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

namespace mines {

//! Probability mass per cell as used by the sum checks. Flags are 1, missing values 0.
static Grid<double> probabilityMass(const BoardState& board, const ProbabilityGrid& grid) {
	Grid<double> mass(grid.width(), grid.height(), 0.0);
	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const Coord c{x, y};
			if (board.at(c).isFlagged()) {
				mass.set(c, 1.0);
			} else if (const auto& p = grid.at(c)) {
				mass.set(c, *p);
			}
		}
	}
	return mass;
}

//! 3x3 box sum of every cell, computed as a horizontal then a vertical sliding window.
static Grid<double> neighborSums(const Grid<double>& mass) {
	const auto width  = mass.width();
	const auto height = mass.height();

	Grid<double> rows(width, height, 0.0);
	for (Id y = 0; y < height; ++y) {
		for (Id x = 0; x < width; ++x) {
			double sum = mass.at({x, y});
			if (x > 0)
				sum += mass.at({x - 1, y});
			if (x + 1 < width)
				sum += mass.at({x + 1, y});
			rows.set({x, y}, sum);
		}
	}

	Grid<double> box(width, height, 0.0);
	for (Id y = 0; y < height; ++y) {
		for (Id x = 0; x < width; ++x) {
			double sum = rows.at({x, y});
			if (y > 0)
				sum += rows.at({x, y - 1});
			if (y + 1 < height)
				sum += rows.at({x, y + 1});
			box.set({x, y}, sum);
		}
	}
	return box;
}

static std::optional<Inconsistency> checkRange(const BoardState& board, const ProbabilityGrid& grid) {
	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const Coord c{x, y};
			const auto& p = grid.at(c);
			if (!p)
				continue;

			// Revealed cells carry no probability. Zero is only meaningful as "certain safe" on a cell that can still be opened.
			const bool validZero = *p == 0.0 && board.at(c).isHidden();
			if (board.at(c).isRevealed() || !std::isfinite(*p) || *p > 1.0 || (*p <= 0.0 && !validZero)) {
				return Inconsistency{InconsistencyKind::OutOfRange, c, std::nullopt, *p};
			}
		}
	}
	return std::nullopt;
}

static std::optional<Inconsistency> checkGuessBound(const BoardState& board, const ProbabilityGrid& grid) {
	bool hasSafe      = false;
	bool hasUncertain = false;
	double best       = 1.0; //!< Lowest uncertain value.
	double bestAny    = 1.0; //!< Lowest value at all, reported if nothing is uncertain.

	for (Id y = 0; y < grid.height(); ++y) {
		for (Id x = 0; x < grid.width(); ++x) {
			const Coord c{x, y};
			const auto& p = grid.at(c);
			if (!p || board.at(c).isFlagged())
				continue;

			bestAny = std::min(bestAny, *p);
			if (isCertainSafe(p)) {
				hasSafe = true;
			} else if (isUncertain(p)) {
				hasUncertain = true;
				best         = std::min(best, *p);
			}
		}
	}

	// With safe cells to open no guess is needed.
	if (hasSafe)
		return std::nullopt;

	if (!hasUncertain || !(0.0 < best && best < 1.0)) {
		return Inconsistency{InconsistencyKind::NoValidGuessBound, std::nullopt, std::nullopt, hasUncertain ? best : bestAny};
	}
	return std::nullopt;
}

static std::optional<Inconsistency> checkGlobalSum(const Grid<double>& mass, const int minesRemaining, const Tolerance& tolerance) {
	double total        = 0.0;
	std::size_t certain = 0;
	for (Id y = 0; y < mass.height(); ++y) {
		for (Id x = 0; x < mass.width(); ++x) {
			const auto value = mass.at({x, y});
			total += value;
			if (value == 1.0)
				++certain;
		}
	}

	const auto expected = static_cast<double>(minesRemaining) + static_cast<double>(certain);
	if (!isClose(total, expected, tolerance)) {
		return Inconsistency{InconsistencyKind::GlobalSumMismatch, std::nullopt, expected, total};
	}
	return std::nullopt;
}

static std::optional<Inconsistency> checkLocalSums(const BoardState& board, const Grid<double>& mass, const Tolerance& tolerance) {
	const auto sums = neighborSums(mass);
	for (Id y = 0; y < board.height(); ++y) {
		for (Id x = 0; x < board.width(); ++x) {
			const Coord c{x, y};
			const auto& cell = board.at(c);
			if (!cell.isRevealed())
				continue;

			const auto expected = static_cast<double>(cell.adjacentMines);
			if (!isClose(sums.at(c), expected, tolerance)) {
				return Inconsistency{InconsistencyKind::LocalSumMismatch, c, expected, sums.at(c)};
			}
		}
	}
	return std::nullopt;
}

bool isClose(const double a, const double b, const Tolerance& tolerance) {
	return std::abs(a - b) <= tolerance.absolute + tolerance.relative * std::max(std::abs(a), std::abs(b));
}

std::optional<Inconsistency> verifyProbabilities(const BoardState& board, const ProbabilityGrid& grid, const int minesRemaining,
                                                 const Tolerance& tolerance) {
	assert(grid.sameShape(board.width(), board.height()));

	if (auto failure = checkRange(board, grid))
		return failure;
	if (auto failure = checkGuessBound(board, grid))
		return failure;

	const auto mass = probabilityMass(board, grid);
	if (auto failure = checkGlobalSum(mass, minesRemaining, tolerance))
		return failure;
	return checkLocalSums(board, mass, tolerance);
}

const char* toString(const InconsistencyKind kind) {
	switch (kind) {
	case InconsistencyKind::OutOfRange:
		return "OutOfRange";
	case InconsistencyKind::NoValidGuessBound:
		return "NoValidGuessBound";
	case InconsistencyKind::GlobalSumMismatch:
		return "GlobalSumMismatch";
	case InconsistencyKind::LocalSumMismatch:
		return "LocalSumMismatch";
	}
	return "Unknown";
}

std::string describe(const Inconsistency& inconsistency) {
	std::ostringstream out;
	out.precision(12);

	out << toString(inconsistency.kind) << ": ";
	switch (inconsistency.kind) {
	case InconsistencyKind::OutOfRange:
		out << "probability " << inconsistency.computed << " outside of ]0, 1]";
		break;
	case InconsistencyKind::NoValidGuessBound:
		out << "best probability " << inconsistency.computed << " outside of ]0, 1[";
		break;
	case InconsistencyKind::GlobalSumMismatch:
		out << "total probability doesn't add up to the number of mines left";
		break;
	case InconsistencyKind::LocalSumMismatch:
		out << "probability sum around a number doesn't add up to the number";
		break;
	}

	if (inconsistency.cell)
		out << " at (" << inconsistency.cell->x << ", " << inconsistency.cell->y << ")";
	if (inconsistency.expected)
		out << " (expected " << *inconsistency.expected << ", computed " << inconsistency.computed << ")";
	out << ".";
	return out.str();
}

} // namespace mines
