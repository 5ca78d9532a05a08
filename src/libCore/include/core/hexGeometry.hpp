#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace hexsnake {

//! True if the cell lies on a hexagonal board of the given radius.
bool isOnBoard(HexCell cell, int radius);

//! All cells of a board with given radius. Ordered by q, then r.
std::vector<HexCell> boardCells(int radius);

//! Unit offset of a heading in axial coordinates.
HexCell unitVector(Heading heading);

//! Neighbor of the cell in direction of the heading. Not checked against any board.
HexCell neighbor(HexCell cell, Heading heading);

//! Rotate the heading by one step. delta must be -1 (counter clockwise) or +1 (clockwise).
//! \note Throws std::invalid_argument for any other delta.
Heading rotate(Heading heading, int delta);

//! Heading pointing in the opposite direction.
Heading invert(Heading heading);

std::string_view toString(Heading heading);

} // namespace hexsnake
