#include "model/boardState.hpp"

namespace mines {

std::size_t countFlags(const BoardState& board) {
	std::size_t flags = 0;
	for (Id y = 0; y < board.height(); ++y) {
		for (Id x = 0; x < board.width(); ++x) {
			if (board.at({x, y}).isFlagged())
				++flags;
		}
	}
	return flags;
}

} // namespace mines
