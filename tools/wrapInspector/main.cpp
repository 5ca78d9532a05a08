#include "core/board.hpp"
#include "core/config.hpp"
#include "core/hexGeometry.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>

namespace hexsnake::tools {

struct EdgeStep {
	std::string_view description;
	HexCell cell;
	Heading heading;
};

//! Edge cells in the middle of every edge plus two off-centre cells on the lower and upper edge.
static std::array<EdgeStep, 8> makeEdgeSteps(const int radius) {
	return {{
	        {"left edge, heading left", {-radius, 0}, Heading::Left},
	        {"right edge, heading right", {radius, 0}, Heading::Right},
	        {"lower edge, heading down left", {0, radius}, Heading::DownLeft},
	        {"upper edge, heading up right", {0, -radius}, Heading::UpRight},
	        {"lower edge, heading up left", {0, radius}, Heading::UpLeft},
	        {"upper edge, heading down right", {0, -radius}, Heading::DownRight},
	        {"lower edge third cell, heading up right", {-2, radius}, Heading::UpRight},
	        {"upper edge third cell, heading down left", {2, -radius}, Heading::DownLeft},
	}};
}

static void inspect(const Board& board) {
	std::cout << std::format("=== Wrap axis '{}' (radius {}) ===\n", toString(board.wrapAxis()), board.radius());

	for (const auto& edge: makeEdgeSteps(board.radius())) {
		const auto outcome = board.classifyStep(edge.cell, edge.heading);

		std::cout << std::format("{}: ({}, {}) heading {}\n", edge.description, edge.cell.q, edge.cell.r, toString(edge.heading));
		if (const auto* normal = std::get_if<NormalStep>(&outcome)) {
			std::cout << std::format("  stays on board at ({}, {})\n", normal->next.q, normal->next.r);
		} else if (const auto* portal = std::get_if<PortalStep>(&outcome)) {
			const auto mirrored = board.mirror(edge.cell);
			std::cout << std::format("  portal: mirrored ({}, {}) {}, exit ({}, {}) heading {}\n", mirrored.q, mirrored.r,
			                         board.isOnBoard(mirrored) ? "on board" : "off board", portal->exit.q, portal->exit.r,
			                         toString(board.reflect(edge.heading)));
		} else {
			std::cout << "  blocked: wall\n";
		}
	}
	std::cout << '\n';
}

} // namespace hexsnake::tools

int main(int argc, char** argv) {
	using namespace hexsnake;

	int radius = GameConfig{}.boardRadius;
	try {
		if (argc > 1) {
			radius = std::stoi(argv[1]);
		}

		for (const auto axis: {WrapAxis::Horizontal, WrapAxis::Diagonal1, WrapAxis::Diagonal2}) {
			tools::inspect(Board{radius, axis});
		}
	} catch (const std::exception& e) {
		std::cerr << std::format("wrapInspector: {}\nUsage: {} [radius]\n", e.what(), argv[0]);
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
