#pragma once

#include "core/IRandomSource.hpp"
#include "core/SafeQueue.hpp"
#include "core/board.hpp"
#include "core/config.hpp"
#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "core/gameState.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace hexsnake {

using EventQueue = SafeQueue<GameEvent>;

//! One game session and its command loop.
//! External code pushes events (ticks, turns, start/restart) and listens for signals.
class Game {
public:
	//! Create a waiting session. The wrap axis is picked from rng unless the config forces one.
	//! \note Throws std::invalid_argument for an invalid config.
	explicit Game(GameConfig config = {}, std::unique_ptr<IRandomSource> rng = nullptr);
	~Game();

	void run();                      //!< Handle events until shutdown or stop (blocking).
	void stop();                     //!< Leave run() without a shutdown event. Wakes a blocked loop.
	std::size_t processPending();    //!< Handle all queued events without blocking. Returns number handled.
	void pushEvent(GameEvent event); //!< Push an event to the event queue.
	bool isActive() const;           //!< True while the event loop of run() is active.

	GameState snapshot() const; //!< Copy of the current session state.
	Board board() const;        //!< Copy of the current session board.
	const GameConfig& config() const;

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void handle(const GameEvent& event);
	void handleEvent(const StartEvent& event);
	void handleEvent(const RestartEvent& event);
	void handleEvent(const TurnEvent& event);
	void handleEvent(const TickEvent& event);
	void handleEvent(const ShutdownEvent& event);

	WrapAxis chooseAxis();
	void resetSession(); //!< Replace board and state with a fresh waiting session.

private:
	GameConfig m_config;
	std::unique_ptr<IRandomSource> m_rng;
	std::atomic<bool> m_loopActive{false};
	std::atomic<bool> m_stopRequested{false};

	mutable std::mutex m_stateMutex; //!< Guards board and state against readers on other threads.
	Board m_board;
	GameState m_state;

	EventQueue m_eventQueue; //!< Queue of commands we have to handle.
	EventHub m_eventHub;     //!< Hub to signal updates of the game state to external components.
};

} // namespace hexsnake
