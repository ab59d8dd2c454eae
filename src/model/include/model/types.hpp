#pragma once

#include <cstdint>

namespace mines {

using Id = unsigned; //!< Board index used by all libraries.

//! Coordinate pair for the board. Origin is the top left cell.
struct Coord {
	Id x, y;

	bool operator==(const Coord&) const = default;
};

//! Lexicographic (x, then y) ordering. Used wherever a deterministic pick among cells is needed.
inline constexpr bool lexicographicLess(Coord a, Coord b) {
	return a.x != b.x ? a.x < b.x : a.y < b.y;
}

} // namespace mines
