#ifndef REQFLOW_RESULT_AGGREGATOR_H_
#define REQFLOW_RESULT_AGGREGATOR_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "common/workflow_types.h"

namespace Reqflow {

// Running counters of a phase in progress.
struct ProgressCounters {
	size_t completed = 0;
	size_t total = 0;
	size_t passed = 0;
	size_t failed = 0;
	size_t errored = 0;
};

/**
 * Collects per-item outcomes of one phase, keyed by item id.
 *
 * Record() is safe to call from any worker thread. Statistics are computed
 * by Finalize() in queue order, so they do not depend on completion order.
 */
class ResultAggregator {
	public:
		/**
		 * @param ordered_ids  item ids in queue order
		 * @param prior_scores score of each item before this phase, if any;
		 *                     used for the improved counter
		 */
		ResultAggregator(Phase phase, std::vector<std::string> ordered_ids,
				absl::flat_hash_map<std::string, double> prior_scores = {});

		/**
		 * Stores the outcome of `id`. The first write wins; returns nullopt for
		 * a repeated or unknown id, else the counters including this outcome.
		 */
		std::optional<ProgressCounters> Record(const std::string& id, PhaseOutcome outcome,
				PhaseArtifact artifact = PhaseArtifact());

		ProgressCounters Counters() const;

		/**
		 * Builds the immutable PhaseResult. Ids that were never recorded get an
		 * error outcome so the result always has one entry per input item.
		 */
		PhaseResult Finalize(std::chrono::milliseconds elapsed) const;

	private:
		struct Entry {
			PhaseOutcome outcome;
			PhaseArtifact artifact;
		};

		const Phase phase_;
		const std::vector<std::string> ordered_ids_;
		const absl::flat_hash_set<std::string> known_ids_;
		const absl::flat_hash_map<std::string, double> prior_scores_;

		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, Entry> recorded_ ABSL_GUARDED_BY(mu_);
		ProgressCounters counters_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reqflow

#endif // REQFLOW_RESULT_AGGREGATOR_H_
