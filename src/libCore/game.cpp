#include "core/game.hpp"
#include "core/hexGeometry.hpp"
#include "core/mersenneRandom.hpp"
#include "core/tickRules.hpp"

#include "Logging.hpp"

#include <format>
#include <stdexcept>

namespace hexsnake {

static GameConfig validated(GameConfig config) {
	validate(config);
	return config;
}

static std::unique_ptr<IRandomSource> orDefault(std::unique_ptr<IRandomSource> rng) {
	return rng ? std::move(rng) : std::make_unique<MersenneRandom>();
}

Game::Game(GameConfig config, std::unique_ptr<IRandomSource> rng)
    : m_config{validated(config)}, m_rng{orDefault(std::move(rng))}, m_board{m_config.boardRadius, chooseAxis()} {
	m_state = newSession(m_board, *m_rng);

	auto logger = core::Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] Session created. Radius {}, wrap axis '{}'.", m_board.radius(), toString(m_board.wrapAxis())));
}

Game::~Game() {
	stop();
}

void Game::pushEvent(GameEvent event) {
	m_eventQueue.Push(event);
}

void Game::run() {
	// Blocking loop: intended to live on its own thread.
	m_loopActive = true;

	while (m_loopActive && !m_stopRequested) {
		try {
			handle(m_eventQueue.Pop());
		} catch (const std::runtime_error&) {
			// Pop only throws once the queue was released by stop().
			if (!m_stopRequested) {
				m_loopActive = false;
				throw;
			}
		}
	}
	m_loopActive = false;

	auto logger = core::Logger();
	logger.Log(Logging::LogLevel::Info, "[Game] Event loop stopped.");
}

void Game::stop() {
	if (m_stopRequested.exchange(true)) {
		return;
	}
	m_eventQueue.Release();
}

std::size_t Game::processPending() {
	std::size_t handled = 0u;
	while (auto event = m_eventQueue.TryPop()) {
		handle(*event);
		++handled;
	}
	return handled;
}

bool Game::isActive() const {
	return m_loopActive;
}

GameState Game::snapshot() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_state;
}

Board Game::board() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_board;
}

const GameConfig& Game::config() const {
	return m_config;
}

void Game::handle(const GameEvent& event) {
	std::visit([&](auto&& ev) { handleEvent(ev); }, event);
}

void Game::handleEvent(const StartEvent&) {
	if (m_state.lifecycle != Lifecycle::NotStarted) {
		auto logger = core::Logger();
		logger.Log(Logging::LogLevel::Debug, "[Game] Start ignored: session already started.");
		return;
	}

	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_state.lifecycle = Lifecycle::Running;
	}

	auto logger = core::Logger();
	logger.Log(Logging::LogLevel::Info, "[Game] Session started.");
	m_eventHub.signal(GS_StateChange);
}

void Game::handleEvent(const RestartEvent&) {
	resetSession();
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_state.lifecycle = Lifecycle::Running;
	}

	auto logger = core::Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] Session restarted with wrap axis '{}'.", toString(m_board.wrapAxis())));
	m_eventHub.signal(GS_StateChange);
}

void Game::handleEvent(const TurnEvent& event) {
	auto logger = core::Logger();
	if (m_state.lifecycle != Lifecycle::Running) {
		logger.Log(Logging::LogLevel::Debug, "[Game] Turn ignored: session not running.");
		return;
	}

	try {
		const auto heading = rotate(m_state.heading, event.delta);

		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_state.heading = heading;
	} catch (const std::invalid_argument& e) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Turn rejected: {}", e.what()));
	}
}

void Game::handleEvent(const TickEvent&) {
	auto logger = core::Logger();
	if (m_state.lifecycle != Lifecycle::Running) {
		logger.Log(Logging::LogLevel::Debug, "[Game] Tick ignored: session not running.");
		return;
	}

	auto result = advance(m_state, m_board, m_config, *m_rng, SteadyClock::now());
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_state = std::move(result.state);
	}

	const auto& delta = result.delta;
	uint64_t signals  = GS_None;
	switch (delta.kind) {
	case StepKind::HitWall:
	case StepKind::HitSelf:
		logger.Log(Logging::LogLevel::Info, std::format("[Game] Game over: snake hit {} at ({}, {}) heading {}. Score {}.",
		                                                delta.kind == StepKind::HitWall ? "a wall" : "itself", delta.head.cell.q,
		                                                delta.head.cell.r, toString(delta.heading), delta.score));
		signals |= GS_StateChange;
		break;
	case StepKind::Wrapped:
		logger.Log(Logging::LogLevel::Debug, std::format("[Game] Wrapped to ({}, {}) on face {} heading {}.", delta.head.cell.q, delta.head.cell.r,
		                                                 delta.head.face, toString(delta.heading)));
		signals |= GS_SnakeMove | GS_FaceChange;
		break;
	case StepKind::Moved:
		signals |= GS_SnakeMove;
		break;
	case StepKind::Ignored:
		break;
	}
	if (delta.ate) {
		signals |= GS_ScoreChange;
	}
	if (delta.foodMoved) {
		signals |= GS_FoodChange;
	}

	m_eventHub.signalMask(signals);
	m_eventHub.signalDelta(delta);
}

void Game::handleEvent(const ShutdownEvent&) {
	m_loopActive = false;
}

WrapAxis Game::chooseAxis() {
	if (m_config.wrapAxis) {
		return *m_config.wrapAxis;
	}
	return static_cast<WrapAxis>(m_rng->index(kWrapAxisCount));
}

void Game::resetSession() {
	Board board{m_config.boardRadius, chooseAxis()};
	GameState state = newSession(board, *m_rng);

	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_board = std::move(board);
	m_state = std::move(state);
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace hexsnake
