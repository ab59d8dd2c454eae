#include "autoplay/eventHub.hpp"

#include <algorithm>

namespace mines {

void EventHub::subscribe(IAutoplayListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IAutoplayListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(
	        std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	        m_listeners.end());
}

void EventHub::signal(const AutoplayEvent& event) {
	const auto signal = signalOf(event);

	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (const auto& [listener, signalMask]: m_listeners) {
		if (signalMask & signal) {
			// Listener callbacks run on the autoplay worker; keep them light.
			listener->onAutoplayEvent(event);
		}
	}
}

} // namespace mines
