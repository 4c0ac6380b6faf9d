#ifndef REQFLOW_PHASE_HANDLERS_H_
#define REQFLOW_PHASE_HANDLERS_H_

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "capabilities/capability.h"
#include "common/workflow_config.h"
#include "pipeline/phase_handler.h"

namespace Reqflow {

class ClarificationGate;

/**
 * Everything a phase handler may read besides its own unit. Built by the
 * orchestrator for each phase from the run state at that point.
 */
struct PhaseContext {
	std::string correlation_id;
	WorkflowConfig config;
	RequirementsCapability* capability = nullptr;
	ClarificationGate* gate = nullptr;
	// Search corpus for duplicate detection
	std::vector<RequirementItem> run_items;
	// Open issues per item id, from the quality review
	absl::btree_map<std::string, std::vector<QualityIssue>> issues;
};

// Unit = source document. Passes if at least one requirement was mined.
class MiningHandler : public PhaseHandler {
	public:
		explicit MiningHandler(RequirementsCapability& capability) : capability_(capability) {}
		Phase phase() const override { return Phase::Mining; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;
	private:
		RequirementsCapability& capability_;
};

class GraphHandler : public PhaseHandler {
	public:
		explicit GraphHandler(RequirementsCapability& capability) : capability_(capability) {}
		Phase phase() const override { return Phase::KGBuild; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;
	private:
		RequirementsCapability& capability_;
};

class ValidationHandler : public PhaseHandler {
	public:
		ValidationHandler(RequirementsCapability& capability, double pass_threshold)
			: capability_(capability), pass_threshold_(pass_threshold) {}
		Phase phase() const override { return Phase::Validating; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;
	private:
		RequirementsCapability& capability_;
		const double pass_threshold_;
};

// Suggest, rewrite, then re-evaluate the rewritten text.
class RewriteHandler : public PhaseHandler {
	public:
		RewriteHandler(RequirementsCapability& capability, double pass_threshold)
			: capability_(capability), pass_threshold_(pass_threshold) {}
		Phase phase() const override { return Phase::Rewriting; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;
	private:
		RequirementsCapability& capability_;
		const double pass_threshold_;
};

/**
 * Flags LowScore below the pass threshold and Duplicate for search hits on
 * another item of the run at or above the duplicate threshold.
 */
class QualityReviewHandler : public PhaseHandler {
	public:
		QualityReviewHandler(RequirementsCapability& capability, const WorkflowConfig& config,
				std::vector<RequirementItem> corpus)
			: capability_(capability), config_(config), corpus_(std::move(corpus)) {}
		Phase phase() const override { return Phase::QAReview; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;
	private:
		RequirementsCapability& capability_;
		const WorkflowConfig config_;
		const std::vector<RequirementItem> corpus_;
};

/**
 * Asks one question per open issue of the unit and waits for all of them.
 * "accept" keeps the text, "reject" fails the item, any other answer
 * replaces the text. A timed-out question fails the item for manual review.
 */
class ClarificationHandler : public PhaseHandler {
	public:
		static constexpr char kAccept[] = "accept";
		static constexpr char kReject[] = "reject";

		ClarificationHandler(ClarificationGate& gate, std::string correlation_id,
				absl::btree_map<std::string, std::vector<QualityIssue>> issues,
				std::chrono::milliseconds timeout)
			: gate_(gate), correlation_id_(std::move(correlation_id)),
			  issues_(std::move(issues)), timeout_(timeout) {}
		Phase phase() const override { return Phase::Clarification; }
		absl::StatusOr<HandlerResult> Handle(const RequirementItem& unit,
				const CancellationToken& token) override;

		static std::string QuestionId(const std::string& correlation_id, const std::string& item_id,
				const QualityIssue& issue);

	private:
		ClarificationGate& gate_;
		const std::string correlation_id_;
		const absl::btree_map<std::string, std::vector<QualityIssue>> issues_;
		const std::chrono::milliseconds timeout_;
};

/**
 * Handler for `phase`, or nullptr for phases without work units.
 */
std::unique_ptr<PhaseHandler> MakePhaseHandler(Phase phase, const PhaseContext& context);

} // namespace Reqflow

#endif // REQFLOW_PHASE_HANDLERS_H_
