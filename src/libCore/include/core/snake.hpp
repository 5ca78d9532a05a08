#pragma once

#include "core/types.hpp"

#include <vector>

namespace hexsnake {

//! One body part of the snake.
struct Segment {
	HexCell cell;
	Face face{0u};

	bool operator==(const Segment&) const = default;
};

//! Ordered snake body. Element 0 is the head.
class Snake {
public:
	Snake() = default;
	explicit Snake(std::vector<Segment> body);

	//! Canonical snake at session start: (0,0), (-1,0), (-2,0) on face A.
	static Snake initial();

	const Segment& head() const;
	const std::vector<Segment>& body() const;
	std::size_t length() const;

	bool occupies(HexCell cell, Face face) const; //!< True if any segment sits on the given cell of the face.
	bool occupies(const Segment& segment) const;

	//! Body parts on one face, head first. Used to draw one face at a time.
	std::vector<Segment> segmentsOn(Face face) const;

	Snake prepended(const Segment& newHead) const; //!< New snake one segment longer.
	Snake withoutTail() const;                     //!< New snake one segment shorter.

private:
	std::vector<Segment> m_body;
};

} // namespace hexsnake
