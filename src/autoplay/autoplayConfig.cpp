#include "autoplay/autoplayConfig.hpp"

namespace mines {

FailureAction VerificationPolicy::actionFor(const InconsistencyKind kind) const {
	switch (kind) {
	case InconsistencyKind::OutOfRange:
		return outOfRange;
	case InconsistencyKind::NoValidGuessBound:
		return noValidGuessBound;
	case InconsistencyKind::GlobalSumMismatch:
		return globalSumMismatch;
	case InconsistencyKind::LocalSumMismatch:
		return localSumMismatch;
	}
	return FailureAction::Abort;
}

VerificationPolicy VerificationPolicy::uniform(const FailureAction action) {
	return {action, action, action, action};
}

const char* toString(const FailureAction action) {
	switch (action) {
	case FailureAction::Abort:
		return "Abort";
	case FailureAction::Restart:
		return "Restart";
	case FailureAction::Continue:
		return "Continue";
	}
	return "Unknown";
}

} // namespace mines
