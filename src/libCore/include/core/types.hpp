#pragma once

#include <cstddef>

namespace hexsnake {

using Face = unsigned; //!< Board face. 0 -> A, 1 -> B.

//! Axial hex coordinate. Third coordinate is implicit: s = -q - r.
struct HexCell {
	int q, r;

	bool operator==(const HexCell&) const = default;
};

//! Movement direction of the snake head. Ordered clockwise.
enum class Heading { Right = 0, DownRight = 1, DownLeft = 2, Left = 3, UpLeft = 4, UpRight = 5 };

//! Pair of opposite board edges that act as portals.
enum class WrapAxis {
	Horizontal = 0, //!< Edges q = +-R.
	Diagonal1  = 1, //!< Edges r = +-R.
	Diagonal2  = 2  //!< Edges s = -q-r = +-R.
};

inline constexpr std::size_t kHeadingCount  = 6u;
inline constexpr std::size_t kWrapAxisCount = 3u;

//! Returns the other face of the board.
inline constexpr Face otherFace(const Face face) {
	return face == 0u ? 1u : 0u;
}

} // namespace hexsnake
