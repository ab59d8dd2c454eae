#include "autoplay/pacer.hpp"

#include <algorithm>
#include <thread>

namespace mines {

//! Granularity at which a pause notices cancellation.
static constexpr std::chrono::milliseconds kPauseSlice{50};

SleepPacer::SleepPacer(const AutoplayConfig& config, const CancellationToken& token)
    : m_stepDelay(config.stepDelay), m_gameDelay(config.gameDelay), m_token(token) {
}

void SleepPacer::afterStep() {
	pause(m_stepDelay);
}

void SleepPacer::afterGame() {
	pause(m_gameDelay);
}

void SleepPacer::pause(const std::chrono::milliseconds duration) {
	const auto deadline = std::chrono::steady_clock::now() + duration;
	while (!m_token.isCancelled()) {
		const auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
			break;

		const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
		std::this_thread::sleep_for(std::min(remaining, kPauseSlice));
	}
}

} // namespace mines
