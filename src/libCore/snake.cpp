#include "core/snake.hpp"

#include <algorithm>
#include <cassert>
#include <iterator>
#include <utility>

namespace hexsnake {

Snake::Snake(std::vector<Segment> body) : m_body(std::move(body)) {
}

Snake Snake::initial() {
	return Snake(std::vector<Segment>{{{0, 0}, 0u}, {{-1, 0}, 0u}, {{-2, 0}, 0u}});
}

const Segment& Snake::head() const {
	assert(!m_body.empty());
	return m_body.front();
}

const std::vector<Segment>& Snake::body() const {
	return m_body;
}

std::size_t Snake::length() const {
	return m_body.size();
}

bool Snake::occupies(const HexCell cell, const Face face) const {
	return std::any_of(m_body.begin(), m_body.end(), [&](const Segment& s) { return s.face == face && s.cell == cell; });
}

bool Snake::occupies(const Segment& segment) const {
	return occupies(segment.cell, segment.face);
}

std::vector<Segment> Snake::segmentsOn(const Face face) const {
	std::vector<Segment> result;
	std::copy_if(m_body.begin(), m_body.end(), std::back_inserter(result), [&](const Segment& s) { return s.face == face; });
	return result;
}

Snake Snake::prepended(const Segment& newHead) const {
	std::vector<Segment> body;
	body.reserve(m_body.size() + 1u);

	body.push_back(newHead);
	body.insert(body.end(), m_body.begin(), m_body.end());
	return Snake(std::move(body));
}

Snake Snake::withoutTail() const {
	assert(!m_body.empty());
	return Snake(std::vector<Segment>(m_body.begin(), std::prev(m_body.end())));
}

} // namespace hexsnake
