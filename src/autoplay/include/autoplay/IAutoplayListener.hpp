#pragma once

#include "autoplay/autoplayEvent.hpp"

namespace mines {

class IAutoplayListener {
public:
	virtual ~IAutoplayListener() = default;

	//! Called on the autoplay worker thread.
	virtual void onAutoplayEvent(const AutoplayEvent& event) = 0;
};

} // namespace mines
