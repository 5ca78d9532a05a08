#include "core/game.hpp"

#include "scriptedRandom.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace hexsnake::gtest {

//! Records everything the game publishes.
class RecordingListener : public IGameSignalListener, public IGameStateListener {
public:
	void onGameEvent(GameSignal signal) override { signals.push_back(signal); }
	void onGameDelta(const GameDelta& delta) override { deltas.push_back(delta); }

	std::size_t count(GameSignal signal) const { return static_cast<std::size_t>(std::count(signals.begin(), signals.end(), signal)); }

	std::vector<GameSignal> signals;
	std::vector<GameDelta> deltas;
};

//! Horizontal portals; food always lands on the first free cell, (-15, 0) of face A.
static Game makeGame() {
	GameConfig config;
	config.wrapAxis = WrapAxis::Horizontal;
	return Game(config, std::make_unique<ScriptedRandom>());
}

TEST(Game, WaitsForStart) {
	auto game        = makeGame();
	const auto state = game.snapshot();

	EXPECT_EQ(state.lifecycle, Lifecycle::NotStarted);
	EXPECT_EQ(state.snake.body(), Snake::initial().body());
	EXPECT_EQ(state.heading, Heading::Right);
	EXPECT_EQ(state.food, (Food{{-15, 0}, 0u}));
	EXPECT_EQ(game.board().wrapAxis(), WrapAxis::Horizontal);
	EXPECT_EQ(game.board().radius(), 15);

	// Ticks and turns before the start change nothing.
	game.pushEvent(TurnEvent{1});
	game.pushEvent(TickEvent{});
	EXPECT_EQ(game.processPending(), 2u);
	EXPECT_EQ(game.snapshot().heading, Heading::Right);
	EXPECT_EQ(game.snapshot().snake.head().cell, (HexCell{0, 0}));
}

TEST(Game, TicksMoveSnake) {
	auto game = makeGame();

	game.pushEvent(StartEvent{});
	game.pushEvent(TickEvent{});
	game.pushEvent(TickEvent{});
	EXPECT_EQ(game.processPending(), 3u);

	const auto state = game.snapshot();
	EXPECT_EQ(state.lifecycle, Lifecycle::Running);
	EXPECT_EQ(state.snake.head(), (Segment{{2, 0}, 0u}));
	EXPECT_EQ(state.snake.length(), 3u);
	EXPECT_EQ(state.tick, 2u);
	EXPECT_EQ(game.processPending(), 0u);
}

// Every turn before a tick is applied, the latest decides the heading.
TEST(Game, TurnsBetweenTicks) {
	auto game = makeGame();

	game.pushEvent(StartEvent{});
	game.pushEvent(TurnEvent{1});
	game.pushEvent(TurnEvent{1});
	game.pushEvent(TurnEvent{-1});
	game.pushEvent(TickEvent{});
	game.processPending();

	const auto state = game.snapshot();
	EXPECT_EQ(state.heading, Heading::DownRight);
	EXPECT_EQ(state.snake.head().cell, (HexCell{0, 1}));
}

TEST(Game, RejectsJumpTurn) {
	auto game = makeGame();

	game.pushEvent(StartEvent{});
	game.pushEvent(TurnEvent{3});
	EXPECT_EQ(game.processPending(), 2u);
	EXPECT_EQ(game.snapshot().heading, Heading::Right);
}

TEST(Game, WallEndsSession) {
	auto game = makeGame();
	RecordingListener listener;
	game.subscribeSignals(&listener, GS_StateChange | GS_SnakeMove);
	game.subscribeState(&listener);

	game.pushEvent(StartEvent{});
	game.pushEvent(TurnEvent{1});
	for (int i = 0; i != 16; ++i) {
		game.pushEvent(TickEvent{});
	}
	game.processPending();

	const auto state = game.snapshot();
	EXPECT_EQ(state.lifecycle, Lifecycle::Over);
	EXPECT_EQ(state.snake.head().cell, (HexCell{0, 15}));
	EXPECT_EQ(state.score, 0u);

	EXPECT_EQ(listener.count(GS_StateChange), 2u);
	EXPECT_EQ(listener.count(GS_SnakeMove), 15u);
	ASSERT_EQ(listener.deltas.size(), 16u);
	EXPECT_EQ(listener.deltas.back().kind, StepKind::HitWall);
	EXPECT_EQ(listener.deltas.back().lifecycle, Lifecycle::Over);

	// No more ticks after the crash.
	game.pushEvent(TickEvent{});
	game.pushEvent(StartEvent{});
	game.processPending();
	EXPECT_EQ(listener.deltas.size(), 16u);
	EXPECT_EQ(game.snapshot().lifecycle, Lifecycle::Over);

	game.unsubscribeSignals(&listener);
	game.unsubscribeState(&listener);
}

TEST(Game, RestartCreatesNewSession) {
	auto game = makeGame();

	game.pushEvent(StartEvent{});
	game.pushEvent(TurnEvent{-1});
	game.pushEvent(TurnEvent{-1});
	for (int i = 0; i != 16; ++i) {
		game.pushEvent(TickEvent{});
	}
	game.processPending();
	ASSERT_EQ(game.snapshot().lifecycle, Lifecycle::Over);

	game.pushEvent(RestartEvent{});
	game.processPending();

	const auto state = game.snapshot();
	EXPECT_EQ(state.lifecycle, Lifecycle::Running);
	EXPECT_EQ(state.snake.body(), Snake::initial().body());
	EXPECT_EQ(state.heading, Heading::Right);
	EXPECT_EQ(state.score, 0u);
	EXPECT_EQ(state.tick, 0u);
	EXPECT_EQ(state.currentFace, 0u);
}

TEST(Game, WrapSignalsFaceChange) {
	auto game = makeGame();
	RecordingListener listener;
	game.subscribeSignals(&listener, GS_FaceChange | GS_FoodChange);

	game.pushEvent(StartEvent{});
	for (int i = 0; i != 16; ++i) {
		game.pushEvent(TickEvent{});
	}
	game.processPending();

	const auto state = game.snapshot();
	EXPECT_EQ(state.lifecycle, Lifecycle::Running);
	EXPECT_EQ(state.snake.head(), (Segment{{-15, 0}, 1u}));
	EXPECT_EQ(state.currentFace, 1u);
	EXPECT_EQ(state.wrapGrace, 1u);
	EXPECT_EQ(state.food, (Food{{15, 0}, 1u}));

	EXPECT_EQ(listener.count(GS_FaceChange), 1u);
	EXPECT_EQ(listener.count(GS_FoodChange), 1u);

	game.unsubscribeSignals(&listener);
}

// Axis comes from the random source, a new one on every restart.
TEST(Game, RandomWrapAxisPerSession) {
	Game game(GameConfig{}, std::make_unique<ScriptedRandom>(std::initializer_list<std::size_t>{2u, 0u, 1u, 0u}));
	EXPECT_EQ(game.board().wrapAxis(), WrapAxis::Diagonal2);

	game.pushEvent(StartEvent{});
	game.processPending();
	EXPECT_EQ(game.board().wrapAxis(), WrapAxis::Diagonal2);

	game.pushEvent(RestartEvent{});
	game.processPending();
	EXPECT_EQ(game.board().wrapAxis(), WrapAxis::Diagonal1);
}

TEST(Game, RejectsInvalidConfig) {
	GameConfig tiny;
	tiny.boardRadius = 1;
	EXPECT_THROW(Game{tiny}, std::invalid_argument);

	GameConfig noTicks;
	noTicks.tickInterval = std::chrono::milliseconds{0};
	EXPECT_THROW(Game{noTicks}, std::invalid_argument);
}

TEST(Game, EventLoopOnThread) {
	auto game = makeGame();
	std::thread gameThread([&] { game.run(); });

	game.pushEvent(StartEvent{});
	game.pushEvent(TickEvent{});
	game.pushEvent(TickEvent{});
	game.pushEvent(TurnEvent{-1});
	game.pushEvent(TickEvent{});

	game.pushEvent(ShutdownEvent{});
	gameThread.join();

	EXPECT_FALSE(game.isActive());
	const auto state = game.snapshot();
	EXPECT_EQ(state.heading, Heading::UpRight);
	EXPECT_EQ(state.snake.head().cell, (HexCell{3, -1}));
	EXPECT_EQ(state.tick, 3u);
}

TEST(Game, StopWakesEventLoop) {
	auto game = makeGame();
	std::thread gameThread([&] { game.run(); });

	game.pushEvent(StartEvent{});
	game.pushEvent(TickEvent{});

	// No shutdown event: run() is blocked in the queue or handling the pushed events.
	game.stop();
	gameThread.join();

	EXPECT_FALSE(game.isActive());
}

TEST(Game, RunReturnsAfterStop) {
	auto game = makeGame();
	game.stop();
	game.stop();

	game.run();
	EXPECT_FALSE(game.isActive());
	EXPECT_EQ(game.snapshot().lifecycle, Lifecycle::NotStarted);
}

} // namespace hexsnake::gtest
