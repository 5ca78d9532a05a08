#pragma once

#include "core/gameState.hpp"
#include "core/snake.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <variant>

namespace hexsnake {

struct StartEvent {};   //!< Start the waiting session.
struct RestartEvent {}; //!< Discard the session and start a new one.
struct TurnEvent {
	int delta; //!< -1 turns left, +1 turns right.
};
struct TickEvent {};
struct ShutdownEvent {};

using GameEvent = std::variant<StartEvent, RestartEvent, TurnEvent, TickEvent, ShutdownEvent>;


//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None        = 0,
	GS_StateChange = 1 << 0, //!< Lifecycle changed. Started, restarted or over.
	GS_SnakeMove   = 1 << 1, //!< Snake moved one step.
	GS_FaceChange  = 1 << 2, //!< Displayed face flipped after a wrap.
	GS_ScoreChange = 1 << 3, //!< Food eaten.
	GS_FoodChange  = 1 << 4, //!< Food placed somewhere else.
};


//! Result of a single tick.
enum class StepKind {
	Moved,         //!< Regular step on the same face.
	Wrapped,       //!< Head passed a portal to the other face.
	HitWall,       //!< Game over: left the board through a wall.
	HitSelf,       //!< Game over: ran into its own body.
	Ignored        //!< Session not running. Nothing changed.
};

//! Symbolises the game state change after one tick.
struct GameDelta {
	uint64_t tick;         //!< Tick number after the step.
	StepKind kind;         //!< What happened.
	bool ate;              //!< Food eaten on this tick.
	unsigned score;        //!< Score after the tick.
	Lifecycle lifecycle;   //!< Lifecycle after the tick.
	Segment head;          //!< Head after the tick.
	Heading heading;       //!< Heading after the tick.
	Food food;             //!< Food after the tick.
	bool foodMoved;        //!< Food position differs from before the tick.
	Face currentFace;      //!< Displayed face after the tick.
};

} // namespace hexsnake
