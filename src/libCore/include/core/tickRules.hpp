#pragma once

#include "core/IRandomSource.hpp"
#include "core/board.hpp"
#include "core/config.hpp"
#include "core/gameEvent.hpp"
#include "core/gameState.hpp"

namespace hexsnake {

//! Fresh session on the given board: canonical snake, heading right, food on a free cell.
GameState newSession(const Board& board, IRandomSource& rng);

//! New state and its delta after one tick.
struct TickResult {
	GameState state;
	GameDelta delta;
};

//! Move the snake one step. Handles portals, collisions, eating and growth.
//! \note Does not modify current. Returns it unchanged unless the session is running.
TickResult advance(const GameState& current, const Board& board, const GameConfig& config, IRandomSource& rng, TimePoint now);

} // namespace hexsnake
