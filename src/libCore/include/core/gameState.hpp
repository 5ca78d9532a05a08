#pragma once

#include "core/snake.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace hexsnake {

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;

enum class Lifecycle {
	NotStarted, //!< Session created, waiting for start.
	Running,    //!< Ticks are processed.
	Over        //!< Snake crashed. Only a restart continues.
};

//! The single food item of a session.
struct Food {
	HexCell cell;
	Face face{0u};

	bool operator==(const Food&) const = default;
};

//! Food was eaten. Kept for the renderer until it expires.
struct EatEvent {
	HexCell cell;         //!< Head position when eating.
	Face face{0u};        //!< Face the food was eaten on.
	TimePoint timestamp;  //!< Tick time of eating.
	TimePoint expiresAt;  //!< Effect is not shown anymore from here on.

	bool activeAt(TimePoint now) const { return now < expiresAt; }
};

//! Complete state of one session. Replaced as a whole on every tick.
struct GameState {
	Snake snake{Snake::initial()};
	Food food{};
	Heading heading{Heading::Right};
	Face currentFace{0u};   //!< Face shown to the player. Flips with every wrap.
	unsigned score{0u};
	Lifecycle lifecycle{Lifecycle::NotStarted};
	unsigned wrapGrace{0u}; //!< Set to 1 on a wrap, counted down on the next regular step.
	std::optional<EatEvent> eatEvent{};
	uint64_t tick{0u};      //!< Number of successful steps.
};

} // namespace hexsnake
