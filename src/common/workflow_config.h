#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "workflow_types.h"

namespace Reqflow {

/**
 * Options of a single workflow run. Submitted with the batch; daemon
 * defaults come from Configuration::DefaultWorkflowConfig().
 */
struct WorkflowConfig {
	std::map<Phase, int> max_concurrent_per_phase = {
		{Phase::Mining, 8},
		{Phase::KGBuild, 4},
		{Phase::Validating, 5},
		{Phase::Rewriting, 3},
		{Phase::QAReview, 5},
		{Phase::Clarification, 10},
	};
	std::chrono::milliseconds per_item_timeout{120000};
	int max_attempts = 3;
	std::chrono::milliseconds retry_backoff{250};
	std::chrono::milliseconds clarification_timeout{300000};
	double pass_threshold = 0.7;
	int max_rewrite_rounds = 1;
	double duplicate_threshold = 0.9;
	int search_top_k = 5;

	int MaxConcurrent(Phase phase) const {
		auto it = max_concurrent_per_phase.find(phase);
		return it == max_concurrent_per_phase.end() ? 1 : it->second;
	}

	// Empty when the options are usable.
	std::vector<std::string> Validate() const;
};

} // namespace Reqflow
