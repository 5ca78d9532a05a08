#include "core/board.hpp"
#include "core/hexGeometry.hpp"

#include <array>
#include <format>
#include <stdexcept>

namespace hexsnake {

using Reflection = std::array<Heading, kHeadingCount>;

// Mirror permutation per wrap axis, indexed by heading.
static constexpr std::array<Reflection, kWrapAxisCount> kReflections{{
        {Heading::Left, Heading::DownLeft, Heading::DownRight, Heading::Right, Heading::UpRight, Heading::UpLeft},
        {Heading::Right, Heading::UpRight, Heading::UpLeft, Heading::Left, Heading::DownLeft, Heading::DownRight},
        {Heading::UpLeft, Heading::Left, Heading::DownLeft, Heading::DownRight, Heading::Right, Heading::UpRight},
}};

static constexpr int sign(const int value) {
	return (value > 0) - (value < 0);
}

Board::Board(const int radius, const WrapAxis axis) : m_radius(radius), m_axis(axis) {
	if (radius < kMinRadius) {
		throw std::invalid_argument(std::format("Board radius must be at least {}, got {}.", kMinRadius, radius));
	}
	m_cells = boardCells(radius);
}

int Board::radius() const {
	return m_radius;
}

WrapAxis Board::wrapAxis() const {
	return m_axis;
}

const std::vector<HexCell>& Board::cells() const {
	return m_cells;
}

bool Board::isOnBoard(const HexCell cell) const {
	return hexsnake::isOnBoard(cell, m_radius);
}

bool Board::isPortalCell(const HexCell cell) const {
	return isOnEdge(m_axis, cell, m_radius);
}

bool Board::isBoundaryCell(const HexCell cell) const {
	return isOnEdge(WrapAxis::Horizontal, cell, m_radius) || isOnEdge(WrapAxis::Diagonal1, cell, m_radius) ||
	       isOnEdge(WrapAxis::Diagonal2, cell, m_radius);
}

StepOutcome Board::classifyStep(const HexCell cell, const Heading heading) const {
	const auto next = neighbor(cell, heading);
	if (isOnBoard(next)) {
		return NormalStep{next};
	}
	if (isPortalCell(cell)) {
		return PortalStep{portalExit(cell)};
	}
	return BlockedStep{};
}

HexCell Board::mirror(const HexCell cell) const {
	switch (m_axis) {
	case WrapAxis::Horizontal:
		return {-cell.q, cell.r};
	case WrapAxis::Diagonal1:
		return {cell.q, -cell.r};
	case WrapAxis::Diagonal2:
		return {-cell.r, -cell.q};
	}
	return cell;
}

HexCell Board::portalExit(const HexCell cell) const {
	auto exit = mirror(cell);

	// Corners of the two non symmetric axes mirror off-board. A single nudge can still be off-board,
	// e.g. (-15, -5) -> (-14, -4), so nudge until on-board. Terminates at the origin at the latest.
	while (!isOnBoard(exit)) {
		exit.q -= sign(exit.q);
		exit.r -= sign(exit.r);
	}
	return exit;
}

Heading Board::reflect(const Heading heading) const {
	const auto& table = kReflections[static_cast<std::size_t>(m_axis)];
	return invert(table[static_cast<std::size_t>(heading)]);
}

bool isOnEdge(const WrapAxis axis, const HexCell cell, const int radius) {
	switch (axis) {
	case WrapAxis::Horizontal:
		return cell.q == -radius || cell.q == radius;
	case WrapAxis::Diagonal1:
		return cell.r == radius || cell.r == -radius;
	case WrapAxis::Diagonal2: {
		const int s = -cell.q - cell.r;
		return s == radius || s == -radius;
	}
	}
	return false;
}

std::string_view toString(const WrapAxis axis) {
	switch (axis) {
	case WrapAxis::Horizontal:
		return "horizontal";
	case WrapAxis::Diagonal1:
		return "diagonal1";
	case WrapAxis::Diagonal2:
		return "diagonal2";
	}
	return "unknown";
}

} // namespace hexsnake
