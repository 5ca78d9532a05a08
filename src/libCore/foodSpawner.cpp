#include "core/foodSpawner.hpp"

#include "Logging.hpp"

#include <format>
#include <vector>

namespace hexsnake {

Food spawnFood(const Board& board, const Snake& snake, IRandomSource& rng, const std::optional<Face> restrictToFace) {
	std::vector<Food> candidates;
	candidates.reserve(board.cells().size() * 2u);

	for (const auto& cell: board.cells()) {
		for (const Face face: {0u, 1u}) {
			if (restrictToFace && *restrictToFace != face) {
				continue;
			}
			if (!snake.occupies(cell, face)) {
				candidates.push_back({cell, face});
			}
		}
	}

	if (candidates.empty()) {
		auto logger = core::Logger();
		logger.Log(Logging::LogLevel::Warning, std::format("[FoodSpawner] No free cell left for food (snake length {}). Placing at origin.", snake.length()));
		return {{0, 0}, 0u};
	}

	return candidates[rng.index(candidates.size())];
}

} // namespace hexsnake
