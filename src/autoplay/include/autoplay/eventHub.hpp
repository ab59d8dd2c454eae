#pragma once

#include "autoplay/IAutoplayListener.hpp"
#include "autoplay/autoplayEvent.hpp"

#include <mutex>
#include <vector>

namespace mines {

//! Allows external components (renderer, reporting) to follow the autoplayer.
class EventHub {
	struct ListenerEntry {
		IAutoplayListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;         //!< What events the listener cares about.
	};

public:
	void subscribe(IAutoplayListener* listener, uint64_t signalMask);
	void unsubscribe(IAutoplayListener* listener);

	//! Forward the event to every listener subscribed to its signal.
	void signal(const AutoplayEvent& event);

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace mines
