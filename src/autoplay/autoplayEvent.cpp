#include "autoplay/autoplayEvent.hpp"

namespace mines {

AutoplaySignal signalOf(const AutoplayEvent& event) {
	struct Visitor {
		AutoplaySignal operator()(const GameStartedEvent&) const { return AS_GameStarted; }
		AutoplaySignal operator()(const ActionsIssuedEvent&) const { return AS_ActionsIssued; }
		AutoplaySignal operator()(const GameFinishedEvent&) const { return AS_GameFinished; }
	};
	return std::visit(Visitor{}, event);
}

} // namespace mines
