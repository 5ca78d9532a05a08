#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <mutex>
#include <vector>

namespace hexsnake {

//! Allows external components to be updated on internal game events.
//! \note Signals are synchronous and run on the game thread.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signal(GameSignal signal);           //!< Signal a game event.
	void signalMask(uint64_t signals);        //!< Signal every event set in the mask, lowest bit first.
	void signalDelta(const GameDelta& delta); //!< Signal the outcome of a tick.

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace hexsnake
