#pragma once

#include "autoplay/autoplayConfig.hpp"
#include "autoplay/cancellationToken.hpp"

#include <chrono>

namespace mines {

//! Slows the autoplayer down for human observers. Never required for correctness.
class IPacer {
public:
	virtual ~IPacer()        = default;
	virtual void afterStep() = 0;
	virtual void afterGame() = 0;
};

//! Headless runs and tests.
class NoPacer : public IPacer {
public:
	void afterStep() override {}
	void afterGame() override {}
};

//! Blocks the worker for the configured delays. Returns early once cancellation is requested.
class SleepPacer : public IPacer {
public:
	SleepPacer(const AutoplayConfig& config, const CancellationToken& token);

	void afterStep() override;
	void afterGame() override;

private:
	void pause(std::chrono::milliseconds duration);

	std::chrono::milliseconds m_stepDelay;
	std::chrono::milliseconds m_gameDelay;
	const CancellationToken& m_token;
};

} // namespace mines
