#include "core/eventHub.hpp"

#include <algorithm>

namespace hexsnake {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase(m_stateListeners, listener);
}

void EventHub::signal(GameSignal signal) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (const auto& [listener, signalMask]: m_signalListeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

void EventHub::signalMask(uint64_t signals) {
	for (uint64_t bit = 1u; signals != 0u; bit <<= 1u) {
		if (signals & bit) {
			signal(static_cast<GameSignal>(bit));
			signals &= ~bit;
		}
	}
}

void EventHub::signalDelta(const GameDelta& delta) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (auto* listener: m_stateListeners) {
		listener->onGameDelta(delta);
	}
}

} // namespace hexsnake
