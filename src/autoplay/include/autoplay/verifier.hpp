#pragma once

#include "model/boardState.hpp"
#include "model/probabilityGrid.hpp"

#include <optional>
#include <string>

namespace mines {

//! Which invariant of a probability grid was violated.
enum class InconsistencyKind {
	OutOfRange,        //!< Value outside ]0, 1], or a zero on a cell that cannot be safe.
	NoValidGuessBound, //!< No certain safe cell and no uncertain cell to guess.
	GlobalSumMismatch, //!< Total probability mass does not match the mines left.
	LocalSumMismatch   //!< Probability mass around a number does not match the number.
};

struct Inconsistency {
	InconsistencyKind kind;
	std::optional<Coord> cell{};      //!< Offending cell for cell local checks.
	std::optional<double> expected{}; //!< Value the check required, if it compares against one.
	double computed{0.0};             //!< Value found in the grid.
};

//! Closeness used by the sum checks: |a - b| <= absolute + relative * max(|a|, |b|).
struct Tolerance {
	double absolute{1e-9};
	double relative{1e-9};
};

bool isClose(double a, double b, const Tolerance& tolerance);

//! Checks a probability grid against the board it was computed for.
//! Runs the range, guess bound, global sum and local sum checks in that order and returns the first violation.
//! Flagged cells count as probability 1 and missing values as 0 in both sum checks.
//! \note Grid and board must have the same shape.
std::optional<Inconsistency> verifyProbabilities(const BoardState& board, const ProbabilityGrid& grid, int minesRemaining,
                                                 const Tolerance& tolerance = {});

const char* toString(InconsistencyKind kind);

//! Human readable description for logs.
std::string describe(const Inconsistency& inconsistency);

} // namespace mines
