#include "minefield/minefield.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace mines {

MinefieldConfig MinefieldConfig::beginner() {
	return {9u, 9u, 10u, true};
}

MinefieldConfig MinefieldConfig::intermediate() {
	return {16u, 16u, 40u, true};
}

MinefieldConfig MinefieldConfig::expert() {
	return {30u, 16u, 99u, true};
}

Minefield::Minefield(const MinefieldConfig& config, const std::uint64_t seed) : m_config(config), m_rng(seed) {
	const auto cells = config.width * config.height;
	if (cells == 0u) {
		throw std::invalid_argument("Minefield: board must have at least one cell.");
	}
	// First click needs one guaranteed safe cell.
	if (config.numMines >= cells) {
		throw std::invalid_argument("Minefield: " + std::to_string(config.numMines) + " mines do not fit on " +
		                            std::to_string(cells) + " cells.");
	}
	reset();
}

std::size_t Minefield::width() const {
	return m_config.width;
}

std::size_t Minefield::height() const {
	return m_config.height;
}

unsigned Minefield::numMines() const {
	return m_config.numMines;
}

int Minefield::minesRemaining() const {
	return static_cast<int>(m_config.numMines) - static_cast<int>(m_flags);
}

const BoardState& Minefield::state() const {
	return m_state;
}

bool Minefield::done() const {
	return m_lost || m_hiddenSafe == 0u;
}

bool Minefield::isWon() const {
	return !m_lost && m_hiddenSafe == 0u;
}

void Minefield::reset() {
	m_state       = BoardState(m_config.width, m_config.height, Cell::unrevealed());
	m_mines       = Grid<std::uint8_t>(m_config.width, m_config.height, 0u);
	m_minesPlaced = false;
	m_lost        = false;
	m_flags       = 0u;
	m_hiddenSafe  = m_config.width * m_config.height - m_config.numMines;

	if (!m_config.firstNeverMine) {
		placeMines(std::nullopt);
	}
}

bool Minefield::reveal(const Coord c) {
	checkBounds(c);
	if (done() || !m_state.at(c).isHidden())
		return false;

	if (!m_minesPlaced) {
		placeMines(c);
	}

	if (m_mines.at(c)) {
		m_lost = true;
		return true;
	}

	floodReveal(c);
	return true;
}

bool Minefield::flag(const Coord c) {
	checkBounds(c);
	if (done())
		return false;

	auto& cell = m_state.at(c);
	switch (cell.kind) {
	case Cell::Kind::Unrevealed:
		cell = Cell::flagged();
		++m_flags;
		return true;
	case Cell::Kind::Flagged:
		cell = Cell::unrevealed();
		--m_flags;
		return true;
	case Cell::Kind::Revealed:
		break;
	}
	return false;
}

bool Minefield::hasMine(const Coord c) const {
	checkBounds(c);
	return m_mines.at(c) != 0u;
}

void Minefield::checkBounds(const Coord c) const {
	if (!m_state.contains(c)) {
		throw std::out_of_range("Minefield: (" + std::to_string(c.x) + ", " + std::to_string(c.y) + ") is outside the " +
		                        std::to_string(m_config.width) + "x" + std::to_string(m_config.height) + " board.");
	}
}

void Minefield::placeMines(const std::optional<Coord> excluded) {
	std::vector<std::size_t> candidates(m_config.width * m_config.height);
	std::iota(candidates.begin(), candidates.end(), std::size_t{0});
	if (excluded) {
		candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(excluded->y * m_config.width + excluded->x));
	}

	std::shuffle(candidates.begin(), candidates.end(), m_rng);
	for (unsigned i = 0; i < m_config.numMines; ++i) {
		const auto index = candidates[i];
		m_mines.set({static_cast<Id>(index % m_config.width), static_cast<Id>(index / m_config.width)}, 1u);
	}
	m_minesPlaced = true;
}

unsigned Minefield::adjacentMines(const Coord c) const {
	unsigned count = 0;
	for (int dy = -1; dy <= 1; ++dy) {
		for (int dx = -1; dx <= 1; ++dx) {
			const int nx = static_cast<int>(c.x) + dx;
			const int ny = static_cast<int>(c.y) + dy;
			if ((dx == 0 && dy == 0) || nx < 0 || ny < 0 || nx >= static_cast<int>(m_config.width) ||
			    ny >= static_cast<int>(m_config.height))
				continue;

			if (m_mines.at({static_cast<Id>(nx), static_cast<Id>(ny)}))
				++count;
		}
	}
	return count;
}

void Minefield::floodReveal(const Coord start) {
	std::vector<Coord> stack{start};
	while (!stack.empty()) {
		const auto c = stack.back();
		stack.pop_back();

		// Flags placed by the player are left alone, even on safe cells.
		if (!m_state.at(c).isHidden())
			continue;

		const auto count = adjacentMines(c);
		m_state.set(c, Cell::revealed(count));
		--m_hiddenSafe;
		if (count != 0u)
			continue;

		for (int dy = -1; dy <= 1; ++dy) {
			for (int dx = -1; dx <= 1; ++dx) {
				const int nx = static_cast<int>(c.x) + dx;
				const int ny = static_cast<int>(c.y) + dy;
				if (nx < 0 || ny < 0 || nx >= static_cast<int>(m_config.width) || ny >= static_cast<int>(m_config.height))
					continue;

				const Coord neighbor{static_cast<Id>(nx), static_cast<Id>(ny)};
				if (m_state.at(neighbor).isHidden())
					stack.push_back(neighbor);
			}
		}
	}
}

} // namespace mines
