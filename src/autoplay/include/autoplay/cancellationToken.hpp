#pragma once

#include <atomic>

namespace mines {

//! Write once quit signal shared between the presentation thread and the autoplay worker.
class CancellationToken {
public:
	void cancel() {
		m_cancelled.store(true, std::memory_order_release);
	}

	bool isCancelled() const {
		return m_cancelled.load(std::memory_order_acquire);
	}

private:
	std::atomic<bool> m_cancelled{false};
};

} // namespace mines
