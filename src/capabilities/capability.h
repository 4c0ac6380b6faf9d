#ifndef REQFLOW_CAPABILITY_H_
#define REQFLOW_CAPABILITY_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "common/cancellation.h"
#include "common/workflow_types.h"

namespace Reqflow {

struct CriterionScore {
	std::string criterion;
	double score = 0.0;
	std::string feedback;
};

struct Evaluation {
	double score = 0.0;
	Verdict verdict = Verdict::Fail;
	std::vector<CriterionScore> per_criterion;
};

struct SearchHit {
	std::string id;
	std::string text;
	double similarity = 0.0;
};

/**
 * Black-box requirements capability (language model, vector store, graph
 * store). Implementations classify failures through the status code:
 * Unavailable, DeadlineExceeded, ResourceExhausted and Aborted are retried,
 * anything else fails the item. Every call receives the attempt's token and
 * should give up once it is cancelled.
 */
class RequirementsCapability {
	public:
		virtual ~RequirementsCapability() = default;

		virtual absl::StatusOr<Evaluation> Evaluate(const std::string& text,
				const CancellationToken& token) = 0;

		// Improvement atoms for `text`
		virtual absl::StatusOr<std::vector<std::string>> Suggest(const std::string& text,
				const CancellationToken& token) = 0;

		virtual absl::StatusOr<std::string> Rewrite(const std::string& text,
				const std::vector<std::string>& atoms, const CancellationToken& token) = 0;

		virtual absl::StatusOr<std::vector<RequirementItem>> Mine(const SourceDocument& document,
				const CancellationToken& token) = 0;

		virtual absl::StatusOr<KnowledgeGraph> BuildGraph(const std::vector<RequirementItem>& items,
				const CancellationToken& token) = 0;

		/**
		 * Top `top_k` entries of `corpus` most similar to `query`, best first.
		 */
		virtual absl::StatusOr<std::vector<SearchHit>> Search(const std::string& query,
				const std::vector<RequirementItem>& corpus, int top_k,
				const CancellationToken& token) = 0;
};

} // namespace Reqflow

#endif // REQFLOW_CAPABILITY_H_
