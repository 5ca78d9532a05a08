#include "core/config.hpp"
#include "core/board.hpp"

#include <format>
#include <stdexcept>

namespace hexsnake {

void validate(const GameConfig& config) {
	if (config.boardRadius < Board::kMinRadius) {
		throw std::invalid_argument(std::format("Board radius must be at least {}, got {}.", Board::kMinRadius, config.boardRadius));
	}
	if (config.tickInterval.count() <= 0) {
		throw std::invalid_argument("Tick interval must be positive.");
	}
	if (config.eatEffectDuration.count() < 0) {
		throw std::invalid_argument("Eat effect duration must not be negative.");
	}
	if (config.pointsPerFood == 0u) {
		throw std::invalid_argument("Food has to be worth points.");
	}
}

} // namespace hexsnake
