#ifndef REQFLOW_SYNTHETIC_CAPABILITY_H_
#define REQFLOW_SYNTHETIC_CAPABILITY_H_

#include <chrono>
#include <random>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "capability.h"

namespace Reqflow {

struct SyntheticOptions {
	std::chrono::milliseconds latency{0};
	// Share of calls that fail with Unavailable before doing any work
	double transient_failure_rate = 0.0;
	uint32_t seed = 42;
};

/**
 * Rule-based stand-in for the language model and vector store so the daemon
 * runs without external services. Scores clarity, testability and
 * measurability from keywords; mines sentences with a modal verb; searches by
 * word overlap.
 */
class SyntheticCapability : public RequirementsCapability {
	public:
		explicit SyntheticCapability(SyntheticOptions options = SyntheticOptions());

		absl::StatusOr<Evaluation> Evaluate(const std::string& text,
				const CancellationToken& token) override;
		absl::StatusOr<std::vector<std::string>> Suggest(const std::string& text,
				const CancellationToken& token) override;
		absl::StatusOr<std::string> Rewrite(const std::string& text,
				const std::vector<std::string>& atoms, const CancellationToken& token) override;
		absl::StatusOr<std::vector<RequirementItem>> Mine(const SourceDocument& document,
				const CancellationToken& token) override;
		absl::StatusOr<KnowledgeGraph> BuildGraph(const std::vector<RequirementItem>& items,
				const CancellationToken& token) override;
		absl::StatusOr<std::vector<SearchHit>> Search(const std::string& query,
				const std::vector<RequirementItem>& corpus, int top_k,
				const CancellationToken& token) override;

		// Pure scoring used by Evaluate, exposed for tests.
		static Evaluation Score(const std::string& text);
		static double Similarity(const std::string& a, const std::string& b);

	private:
		// Sleeps for the configured latency and rolls for a transient failure.
		absl::Status SimulateCall(const CancellationToken& token);

		const SyntheticOptions options_;
		absl::Mutex rng_mu_;
		std::mt19937 rng_ ABSL_GUARDED_BY(rng_mu_);
};

} // namespace Reqflow

#endif // REQFLOW_SYNTHETIC_CAPABILITY_H_
