#pragma once

#include "model/types.hpp"

#include <cassert>
#include <cstddef>
#include <vector>

namespace mines {

//! Dense width x height grid stored row major.
template <class Value>
class Grid {
public:
	Grid() = default;
	Grid(std::size_t width, std::size_t height, const Value& init = Value{});

	std::size_t width() const;
	std::size_t height() const;

	//! Returns true if c lies inside the grid.
	bool contains(Coord c) const;

	//! With x \in [0, width-1] and y \in [0, height-1].
	const Value& at(Coord c) const;
	Value& at(Coord c);
	void set(Coord c, const Value& value);

	bool sameShape(std::size_t width, std::size_t height) const;

private:
	std::size_t index(Coord c) const;

	std::size_t m_width{0};
	std::size_t m_height{0};
	std::vector<Value> m_cells{};
};


template <class Value>
Grid<Value>::Grid(const std::size_t width, const std::size_t height, const Value& init)
    : m_width(width), m_height(height), m_cells(width * height, init) {
}

template <class Value>
std::size_t Grid<Value>::width() const {
	return m_width;
}

template <class Value>
std::size_t Grid<Value>::height() const {
	return m_height;
}

template <class Value>
bool Grid<Value>::contains(const Coord c) const {
	return c.x < m_width && c.y < m_height;
}

template <class Value>
const Value& Grid<Value>::at(const Coord c) const {
	return m_cells[index(c)];
}

template <class Value>
Value& Grid<Value>::at(const Coord c) {
	return m_cells[index(c)];
}

template <class Value>
void Grid<Value>::set(const Coord c, const Value& value) {
	m_cells[index(c)] = value;
}

template <class Value>
bool Grid<Value>::sameShape(const std::size_t width, const std::size_t height) const {
	return m_width == width && m_height == height;
}

template <class Value>
std::size_t Grid<Value>::index(const Coord c) const {
	assert(contains(c));
	return c.y * m_width + c.x;
}

} // namespace mines
