#include "workflow_config.h"

#include "absl/strings/str_cat.h"

namespace Reqflow {

std::vector<std::string> WorkflowConfig::Validate() const {
	std::vector<std::string> errors;
	for (const auto& [phase, limit] : max_concurrent_per_phase) {
		if (limit < 1) {
			errors.push_back(absl::StrCat("max_concurrent for ", PhaseConfigKey(phase),
						" must be at least 1"));
		}
	}
	if (per_item_timeout.count() <= 0) {
		errors.push_back("per_item_timeout must be positive");
	}
	if (max_attempts < 1) {
		errors.push_back("max_attempts must be at least 1");
	}
	if (retry_backoff.count() < 0) {
		errors.push_back("retry_backoff cannot be negative");
	}
	if (clarification_timeout.count() <= 0) {
		errors.push_back("clarification_timeout must be positive");
	}
	if (pass_threshold < 0.0 || pass_threshold > 1.0) {
		errors.push_back("pass_threshold must be within [0, 1]");
	}
	if (max_rewrite_rounds < 1) {
		errors.push_back("max_rewrite_rounds must be at least 1");
	}
	if (duplicate_threshold <= 0.0 || duplicate_threshold > 1.0) {
		errors.push_back("duplicate_threshold must be within (0, 1]");
	}
	if (search_top_k < 1) {
		errors.push_back("search_top_k must be at least 1");
	}
	return errors;
}

} // namespace Reqflow
