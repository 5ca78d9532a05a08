#include "core/hexGeometry.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace hexsnake {

static constexpr std::array<HexCell, kHeadingCount> kDirections{{
        {1, 0},  // Right
        {0, 1},  // DownRight
        {-1, 1}, // DownLeft
        {-1, 0}, // Left
        {0, -1}, // UpLeft
        {1, -1}, // UpRight
}};

static constexpr std::size_t toIndex(const Heading heading) {
	return static_cast<std::size_t>(heading);
}

bool isOnBoard(const HexCell cell, const int radius) {
	return std::abs(cell.q) <= radius && std::abs(cell.r) <= radius && std::abs(cell.q + cell.r) <= radius;
}

std::vector<HexCell> boardCells(const int radius) {
	std::vector<HexCell> cells;
	if (radius < 0) {
		return cells;
	}
	cells.reserve(static_cast<std::size_t>(3 * radius * (radius + 1) + 1));

	for (int q = -radius; q <= radius; ++q) {
		const int rMin = std::max(-radius, -q - radius);
		const int rMax = std::min(radius, -q + radius);
		for (int r = rMin; r <= rMax; ++r) {
			cells.push_back({q, r});
		}
	}
	return cells;
}

HexCell unitVector(const Heading heading) {
	return kDirections[toIndex(heading)];
}

HexCell neighbor(const HexCell cell, const Heading heading) {
	const auto d = unitVector(heading);
	return {cell.q + d.q, cell.r + d.r};
}

Heading rotate(const Heading heading, const int delta) {
	if (delta != -1 && delta != 1) {
		throw std::invalid_argument(std::format("Heading can only rotate by one step, got {}.", delta));
	}

	const auto count = static_cast<int>(kHeadingCount);
	return static_cast<Heading>((static_cast<int>(heading) + delta + count) % count);
}

Heading invert(const Heading heading) {
	return static_cast<Heading>((toIndex(heading) + kHeadingCount / 2) % kHeadingCount);
}

std::string_view toString(const Heading heading) {
	switch (heading) {
	case Heading::Right:
		return "Right";
	case Heading::DownRight:
		return "DownRight";
	case Heading::DownLeft:
		return "DownLeft";
	case Heading::Left:
		return "Left";
	case Heading::UpLeft:
		return "UpLeft";
	case Heading::UpRight:
		return "UpRight";
	}
	return "Unknown";
}

} // namespace hexsnake
