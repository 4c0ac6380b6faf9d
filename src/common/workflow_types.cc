#include "workflow_types.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

namespace Reqflow {

const char* PhaseName(Phase phase) {
	switch (phase) {
		case Phase::Pending: return "Pending";
		case Phase::Mining: return "Mining";
		case Phase::KGBuild: return "KGBuild";
		case Phase::Validating: return "Validating";
		case Phase::Rewriting: return "Rewriting";
		case Phase::QAReview: return "QAReview";
		case Phase::Clarification: return "Clarification";
		case Phase::Completed: return "Completed";
		case Phase::Failed: return "Failed";
	}
	return "Unknown";
}

const char* VerdictName(Verdict verdict) {
	switch (verdict) {
		case Verdict::Pass: return "pass";
		case Verdict::Fail: return "fail";
		case Verdict::Error: return "error";
	}
	return "error";
}

const char* FailureReasonName(FailureReason reason) {
	switch (reason) {
		case FailureReason::None: return "None";
		case FailureReason::Cancelled: return "Cancelled";
		case FailureReason::PhaseExhausted: return "PhaseExhausted";
		case FailureReason::NoRequirements: return "NoRequirements";
	}
	return "None";
}

const char* EventKindName(EventKind kind) {
	switch (kind) {
		case EventKind::AgentMessage: return "agent_message";
		case EventKind::WorkflowStatus: return "workflow_status";
		case EventKind::WorkflowResult: return "workflow_result";
		case EventKind::Question: return "question";
	}
	return "agent_message";
}

const char* IssueKindName(IssueKind kind) {
	switch (kind) {
		case IssueKind::LowScore: return "low_score";
		case IssueKind::Duplicate: return "duplicate";
	}
	return "low_score";
}

const char* PhaseConfigKey(Phase phase) {
	switch (phase) {
		case Phase::Mining: return "mining";
		case Phase::KGBuild: return "kg_build";
		case Phase::Validating: return "validating";
		case Phase::Rewriting: return "rewriting";
		case Phase::QAReview: return "qa_review";
		case Phase::Clarification: return "clarification";
		default: return "";
	}
}

std::optional<Phase> PhaseFromConfigKey(const std::string& key) {
	static const Phase kWorkPhases[] = {
		Phase::Mining, Phase::KGBuild, Phase::Validating,
		Phase::Rewriting, Phase::QAReview, Phase::Clarification};
	for (Phase phase : kWorkPhases) {
		if (key == PhaseConfigKey(phase)) return phase;
	}
	return std::nullopt;
}

bool IsTerminal(Phase phase) {
	return phase == Phase::Completed || phase == Phase::Failed;
}

void KnowledgeGraph::Merge(const KnowledgeGraph& other) {
	MergeAll({&other});
}

void KnowledgeGraph::MergeAll(const std::vector<const KnowledgeGraph*>& fragments) {
	auto edge_key = [](const GraphEdge& e) {
		return absl::StrCat(e.from, "\x1f", e.to, "\x1f", e.relation);
	};
	absl::flat_hash_set<std::string> known;
	absl::flat_hash_set<std::string> known_edges;
	for (const auto& node : nodes) known.insert(node.id);
	for (const auto& edge : edges) known_edges.insert(edge_key(edge));

	for (const KnowledgeGraph* fragment : fragments) {
		for (const auto& node : fragment->nodes) {
			if (known.insert(node.id).second) nodes.push_back(node);
		}
		for (const auto& edge : fragment->edges) {
			if (known_edges.insert(edge_key(edge)).second) edges.push_back(edge);
		}
	}
}

size_t PhaseResult::FlaggedCount() const {
	size_t flagged = 0;
	for (const auto& [id, artifact] : artifacts) {
		if (!artifact.issues.empty()) flagged++;
	}
	return flagged;
}

} // namespace Reqflow
