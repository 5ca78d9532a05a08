#pragma once

#include "core/types.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace hexsnake {

//! Step stays on the board.
struct NormalStep {
	HexCell next;
};
//! Step leaves the board through a wall.
struct BlockedStep {};
//! Step leaves the board through a portal edge and re-enters on the other face.
struct PortalStep {
	HexCell exit; //!< Mirrored cell the head re-enters at.
};

using StepOutcome = std::variant<NormalStep, BlockedStep, PortalStep>;

//! Two faced hexagonal board with one pair of opposite edges acting as portals.
//! The wrap axis is fixed for the lifetime of the board.
class Board {
public:
	//! \note Throws std::invalid_argument for a radius below kMinRadius.
	Board(int radius, WrapAxis axis);

	int radius() const;
	WrapAxis wrapAxis() const;
	const std::vector<HexCell>& cells() const; //!< All on-board cells of one face.

	bool isOnBoard(HexCell cell) const;
	bool isPortalCell(HexCell cell) const;   //!< Cell lies on one of the two active portal edges.
	bool isBoundaryCell(HexCell cell) const; //!< Cell lies on any of the six board edges.

	//! Classify moving one step from cell in direction of heading.
	StepOutcome classifyStep(HexCell cell, Heading heading) const;

	//! Mirror the cell across the symmetry axis of the active edge pair.
	//! \note Result may be off-board.
	HexCell mirror(HexCell cell) const;

	//! Mirrored cell moved towards the origin until it is on-board.
	HexCell portalExit(HexCell cell) const;

	//! Heading after passing a portal. Mirrored and inverted so the head points into the board.
	Heading reflect(Heading heading) const;

public:
	static constexpr int kMinRadius = 2;

private:
	int m_radius;
	WrapAxis m_axis;
	std::vector<HexCell> m_cells;
};

//! True if the cell lies on one of the two edges belonging to the axis.
bool isOnEdge(WrapAxis axis, HexCell cell, int radius);

std::string_view toString(WrapAxis axis);

} // namespace hexsnake
