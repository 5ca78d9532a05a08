#include "core/tickRules.hpp"
#include "core/foodSpawner.hpp"

#include <variant>

namespace hexsnake {

static GameDelta makeDelta(const GameState& state, const StepKind kind, const bool ate, const bool foodMoved) {
	return GameDelta{
	        .tick        = state.tick,
	        .kind        = kind,
	        .ate         = ate,
	        .score       = state.score,
	        .lifecycle   = state.lifecycle,
	        .head        = state.snake.head(),
	        .heading     = state.heading,
	        .food        = state.food,
	        .foodMoved   = foodMoved,
	        .currentFace = state.currentFace,
	};
}

//! Session ends. Everything else stays as it was before the tick.
static TickResult crash(const GameState& current, const StepKind kind) {
	GameState next = current;
	next.lifecycle = Lifecycle::Over;
	return {next, makeDelta(next, kind, false, false)};
}

GameState newSession(const Board& board, IRandomSource& rng) {
	GameState state;
	state.snake = Snake::initial();
	state.food  = spawnFood(board, state.snake, rng);
	return state;
}

TickResult advance(const GameState& current, const Board& board, const GameConfig& config, IRandomSource& rng, const TimePoint now) {
	if (current.lifecycle != Lifecycle::Running) {
		return {current, makeDelta(current, StepKind::Ignored, false, false)};
	}

	const auto& head    = current.snake.head();
	const auto outcome  = board.classifyStep(head.cell, current.heading);
	Segment newHead     = head;
	Heading newHeading  = current.heading;
	bool wrapped        = false;

	if (std::holds_alternative<BlockedStep>(outcome)) {
		return crash(current, StepKind::HitWall);
	}
	if (const auto* step = std::get_if<NormalStep>(&outcome)) {
		newHead = {step->next, head.face};
	} else {
		const auto& portal = std::get<PortalStep>(outcome);
		newHead            = {portal.exit, otherFace(head.face)};
		newHeading         = board.reflect(current.heading);
		wrapped            = true;
	}

	// The tail cell is still occupied during the collision check.
	if (current.snake.occupies(newHead)) {
		return crash(current, StepKind::HitSelf);
	}

	GameState next = current;
	next.heading   = newHeading;
	next.snake     = current.snake.prepended(newHead);

	if (wrapped) {
		next.wrapGrace = 1u;

		// Food follows the board to the face the snake enters.
		const auto mirrored = board.mirror(current.food.cell);
		if (board.isOnBoard(mirrored) && !next.snake.occupies(mirrored, newHead.face)) {
			next.food = {mirrored, newHead.face};
		} else {
			next.food = spawnFood(board, next.snake, rng, newHead.face);
		}
		next.currentFace = newHead.face;
	} else if (next.wrapGrace > 0u) {
		--next.wrapGrace;
	}

	// Eating is checked against the food as it was before this tick.
	const bool ate = newHead.cell == current.food.cell && newHead.face == current.food.face;
	if (ate) {
		next.score += config.pointsPerFood;
		next.food     = spawnFood(board, next.snake, rng);
		next.eatEvent = EatEvent{
		        .cell      = newHead.cell,
		        .face      = newHead.face,
		        .timestamp = now,
		        .expiresAt = now + config.eatEffectDuration,
		};
	} else {
		next.snake = next.snake.withoutTail();
	}

	++next.tick;
	return {next, makeDelta(next, wrapped ? StepKind::Wrapped : StepKind::Moved, ate, !(next.food == current.food))};
}

} // namespace hexsnake
