#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>

namespace hexsnake {

//! Fixed settings of a game. Not changed while sessions run.
struct GameConfig {
	int boardRadius{15};                                 //!< Cells from the center to an edge.
	std::chrono::milliseconds tickInterval{120};         //!< Cadence the driver should push ticks with.
	std::chrono::milliseconds eatEffectDuration{500};    //!< How long the eat effect stays active.
	unsigned pointsPerFood{10u};                         //!< Score gained per eaten food.
	std::optional<WrapAxis> wrapAxis{};                  //!< Force a wrap axis. Random per session if unset.
};

//! Throws std::invalid_argument if the configuration cannot be played.
void validate(const GameConfig& config);

} // namespace hexsnake
