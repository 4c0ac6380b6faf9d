#pragma once

#include <string>

#include "common/workflow_types.h"

namespace Reqflow {

/**
 * Everything the next phase depends on. No external signal is an input:
 * cancellation is handled by the orchestrator before it asks.
 */
struct TransitionInput {
	Phase current = Phase::Pending;
	// Result of the phase that just ran; null for Pending
	const PhaseResult* result = nullptr;
	// Requirement items in the run after the phase was applied
	size_t item_count = 0;
	// Rewrite rounds completed so far, including the one that just ran
	int rewrite_rounds = 0;
	int max_rewrite_rounds = 1;
};

struct Transition {
	Phase next = Phase::Failed;
	FailureReason reason = FailureReason::None;
	std::string detail;
};

// Pending -> Mining -> KGBuild -> Validating -> [Rewriting] -> QAReview
// -> [Clarification] -> Completed, with Failed reachable from any phase.
Transition NextPhase(const TransitionInput& input);

} // namespace Reqflow
