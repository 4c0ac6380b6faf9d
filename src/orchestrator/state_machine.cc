#include "state_machine.h"

#include "absl/strings/str_cat.h"

namespace Reqflow {

namespace {

Transition To(Phase next) {
	return Transition{next, FailureReason::None, ""};
}

Transition Fail(FailureReason reason, std::string detail) {
	return Transition{Phase::Failed, reason, std::move(detail)};
}

} // namespace

Transition NextPhase(const TransitionInput& input) {
	if (IsTerminal(input.current)) {
		return Transition{input.current, FailureReason::None, "terminal"};
	}
	if (input.current == Phase::Pending) return To(Phase::Mining);

	if (input.result == nullptr) {
		return Fail(FailureReason::PhaseExhausted,
				absl::StrCat(PhaseName(input.current), " produced no result"));
	}
	const PhaseStats& stats = input.result->stats;
	if (stats.total > 0 && stats.errored == stats.total) {
		return Fail(FailureReason::PhaseExhausted,
				absl::StrCat("all ", stats.total, " items errored in ", PhaseName(input.current)));
	}

	switch (input.current) {
		case Phase::Mining:
			if (input.item_count == 0) {
				return Fail(FailureReason::NoRequirements, "no requirements after mining");
			}
			return To(Phase::KGBuild);
		case Phase::KGBuild:
			return To(Phase::Validating);
		case Phase::Validating:
			return To(stats.failed > 0 ? Phase::Rewriting : Phase::QAReview);
		case Phase::Rewriting:
			if (stats.failed > 0 && input.rewrite_rounds < input.max_rewrite_rounds) {
				return To(Phase::Rewriting);
			}
			return To(Phase::QAReview);
		case Phase::QAReview:
			return To(input.result->FlaggedCount() > 0 ? Phase::Clarification : Phase::Completed);
		case Phase::Clarification:
			return To(Phase::Completed);
		default:
			return Fail(FailureReason::PhaseExhausted,
					absl::StrCat("no transition from ", PhaseName(input.current)));
	}
}

} // namespace Reqflow
