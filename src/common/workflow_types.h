#ifndef REQFLOW_WORKFLOW_TYPES_H_
#define REQFLOW_WORKFLOW_TYPES_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

namespace Reqflow {

enum class Phase {
	Pending,
	Mining,
	KGBuild,
	Validating,
	Rewriting,
	QAReview,
	Clarification,
	Completed,
	Failed
};

enum class Verdict { Pass, Fail, Error };

enum class FailureReason {
	None,
	Cancelled,
	PhaseExhausted,
	NoRequirements
};

enum class EventKind {
	AgentMessage,
	WorkflowStatus,
	WorkflowResult,
	Question
};

enum class IssueKind { LowScore, Duplicate };

const char* PhaseName(Phase phase);
const char* VerdictName(Verdict verdict);
const char* FailureReasonName(FailureReason reason);
const char* EventKindName(EventKind kind);
const char* IssueKindName(IssueKind kind);

// Lower-case key used in configuration files ("kg_build", "qa_review", ...).
const char* PhaseConfigKey(Phase phase);
std::optional<Phase> PhaseFromConfigKey(const std::string& key);

bool IsTerminal(Phase phase);

struct PhaseOutcome {
	Phase phase = Phase::Pending;
	std::optional<double> score;
	Verdict verdict = Verdict::Error;
	std::string detail;
	int attempts = 0;
};

struct RequirementItem {
	std::string id;
	std::string text;
	std::string source_ref;
	std::optional<double> current_score;
	std::optional<Verdict> verdict;
	std::vector<PhaseOutcome> history;
};

struct SourceDocument {
	std::string id;
	std::string text;
	std::string source_ref;
};

struct QualityIssue {
	IssueKind kind = IssueKind::LowScore;
	std::string detail;
	std::string related_id;  // other item for Duplicate
};

struct GraphNode {
	std::string id;
	std::string label;
	std::string type;
};

struct GraphEdge {
	std::string from;
	std::string to;
	std::string relation;
};

struct KnowledgeGraph {
	std::vector<GraphNode> nodes;
	std::vector<GraphEdge> edges;

	// Appends nodes not yet present (by id) and every edge not yet present.
	void Merge(const KnowledgeGraph& other);
	// Same as Merge over each fragment in order, indexing this graph once.
	void MergeAll(const std::vector<const KnowledgeGraph*>& fragments);
};

/**
 * Side outputs a handler produces for one item next to its verdict.
 */
struct PhaseArtifact {
	std::optional<std::string> revised_text;
	std::vector<RequirementItem> mined_items;
	std::vector<QualityIssue> issues;
	KnowledgeGraph graph;
};

struct PhaseStats {
	size_t total = 0;
	size_t passed = 0;
	size_t failed = 0;
	size_t errored = 0;
	size_t improved = 0;
	double avg_score = 0.0;
};

struct PhaseResult {
	Phase phase = Phase::Pending;
	absl::btree_map<std::string, PhaseOutcome> outcomes;
	absl::btree_map<std::string, PhaseArtifact> artifacts;
	PhaseStats stats;
	std::chrono::milliseconds elapsed{0};

	// Number of items whose artifact carries at least one quality issue.
	size_t FlaggedCount() const;
};

using EventPayload = std::map<std::string, std::string>;

struct WorkflowEvent {
	std::string correlation_id;
	uint64_t sequence_number = 0;
	EventKind kind = EventKind::AgentMessage;
	EventPayload payload;
	std::chrono::system_clock::time_point timestamp;
};

struct ClarificationQuestion {
	std::string question_id;
	std::string correlation_id;
	std::string item_id;
	IssueKind issue = IssueKind::LowScore;
	std::string prompt;
	std::vector<std::string> options;
};

struct ClarificationAnswer {
	std::string question_id;
	std::string value;
	bool timed_out = false;
	bool cancelled = false;
	std::chrono::system_clock::time_point answered_at;
};

struct WorkflowRun {
	std::string correlation_id;
	Phase phase = Phase::Pending;
	FailureReason failure_reason = FailureReason::None;
	std::string failure_detail;
	std::vector<RequirementItem> items;
	KnowledgeGraph graph;
	std::vector<PhaseResult> phase_results;
	std::vector<ClarificationQuestion> questions;
	std::chrono::system_clock::time_point started_at;
	std::optional<std::chrono::system_clock::time_point> ended_at;
};

} // namespace Reqflow

#endif // REQFLOW_WORKFLOW_TYPES_H_
