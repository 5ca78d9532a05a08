#pragma once

#include "core/IRandomSource.hpp"
#include "core/board.hpp"
#include "core/gameState.hpp"
#include "core/snake.hpp"

#include <optional>

namespace hexsnake {

//! Place food uniformly on a free (cell, face) pair.
//! Only cells of restrictToFace are considered if set, both faces otherwise.
//! \note Returns (0,0) on face A if the board is full and logs a warning.
Food spawnFood(const Board& board, const Snake& snake, IRandomSource& rng, std::optional<Face> restrictToFace = std::nullopt);

} // namespace hexsnake
