#include "phase_handlers.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "common/call_status.h"
#include "clarification_gate.h"

namespace Reqflow {

absl::StatusOr<HandlerResult> MiningHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	SourceDocument document{unit.id, unit.text, unit.source_ref};
	auto mined = capability_.Mine(document, token);
	if (!mined.ok()) return mined.status();

	HandlerResult result;
	size_t n = 0;
	for (auto& item : *mined) {
		n++;
		if (item.id.empty()) item.id = absl::StrCat(document.id, "-", n);
		if (item.source_ref.empty()) {
			item.source_ref = document.source_ref.empty() ? document.id : document.source_ref;
		}
		item.current_score.reset();
		item.verdict.reset();
		item.history.clear();
	}
	result.verdict = mined->empty() ? Verdict::Fail : Verdict::Pass;
	result.detail = absl::StrCat("mined ", mined->size(), " requirements");
	result.artifact.mined_items = std::move(*mined);
	return result;
}

absl::StatusOr<HandlerResult> GraphHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	auto graph = capability_.BuildGraph({unit}, token);
	if (!graph.ok()) return graph.status();

	HandlerResult result;
	result.verdict = Verdict::Pass;
	result.detail = absl::StrCat(graph->nodes.size(), " nodes, ", graph->edges.size(), " edges");
	result.artifact.graph = std::move(*graph);
	return result;
}

absl::StatusOr<HandlerResult> ValidationHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	auto evaluation = capability_.Evaluate(unit.text, token);
	if (!evaluation.ok()) return evaluation.status();

	HandlerResult result;
	result.score = evaluation->score;
	// The collaborator's own verdict is advisory; the run threshold decides.
	result.verdict = evaluation->score >= pass_threshold_ ? Verdict::Pass : Verdict::Fail;
	std::vector<std::string> weak;
	for (const auto& criterion : evaluation->per_criterion) {
		if (criterion.score < pass_threshold_) {
			weak.push_back(absl::StrFormat("%s=%.2f", criterion.criterion, criterion.score));
		}
	}
	result.detail = weak.empty() ? "all criteria met" : absl::StrCat("weak: ", absl::StrJoin(weak, ", "));
	return result;
}

absl::StatusOr<HandlerResult> RewriteHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	auto atoms = capability_.Suggest(unit.text, token);
	if (!atoms.ok()) return atoms.status();

	std::string text = unit.text;
	if (!atoms->empty()) {
		auto rewritten = capability_.Rewrite(unit.text, *atoms, token);
		if (!rewritten.ok()) return rewritten.status();
		text = std::move(*rewritten);
	}
	auto evaluation = capability_.Evaluate(text, token);
	if (!evaluation.ok()) return evaluation.status();

	HandlerResult result;
	result.score = evaluation->score;
	result.verdict = evaluation->score >= pass_threshold_ ? Verdict::Pass : Verdict::Fail;
	result.detail = absl::StrCat("applied ", atoms->size(), " suggestions");
	if (text != unit.text) result.artifact.revised_text = std::move(text);
	return result;
}

absl::StatusOr<HandlerResult> QualityReviewHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	auto evaluation = capability_.Evaluate(unit.text, token);
	if (!evaluation.ok()) return evaluation.status();
	auto hits = capability_.Search(unit.text, corpus_, config_.search_top_k, token);
	if (!hits.ok()) return hits.status();

	HandlerResult result;
	result.score = evaluation->score;
	if (evaluation->score < config_.pass_threshold) {
		result.artifact.issues.push_back({IssueKind::LowScore,
				absl::StrFormat("score %.2f below threshold %.2f", evaluation->score, config_.pass_threshold),
				""});
	}
	for (const auto& hit : *hits) {
		if (hit.id == unit.id || hit.similarity < config_.duplicate_threshold) continue;
		result.artifact.issues.push_back({IssueKind::Duplicate,
				absl::StrFormat("similarity %.2f with %s", hit.similarity, hit.id), hit.id});
	}
	result.verdict = result.artifact.issues.empty() ? Verdict::Pass : Verdict::Fail;
	result.detail = result.artifact.issues.empty()
		? "no issues"
		: absl::StrCat(result.artifact.issues.size(), " issues flagged");
	return result;
}

std::string ClarificationHandler::QuestionId(const std::string& correlation_id,
		const std::string& item_id, const QualityIssue& issue) {
	std::string id = absl::StrCat(correlation_id, "/", item_id, "/", IssueKindName(issue.kind));
	if (!issue.related_id.empty()) absl::StrAppend(&id, "/", issue.related_id);
	return id;
}

absl::StatusOr<HandlerResult> ClarificationHandler::Handle(const RequirementItem& unit,
		const CancellationToken& token) {
	HandlerResult result;
	auto it = issues_.find(unit.id);
	if (it == issues_.end() || it->second.empty()) {
		result.verdict = Verdict::Pass;
		result.detail = "no open issues";
		return result;
	}

	std::vector<std::string> question_ids;
	for (const auto& issue : it->second) {
		ClarificationQuestion question;
		question.question_id = QuestionId(correlation_id_, unit.id, issue);
		question.correlation_id = correlation_id_;
		question.item_id = unit.id;
		question.issue = issue.kind;
		if (issue.kind == IssueKind::Duplicate) {
			question.prompt = absl::StrCat("Requirement ", unit.id, " may duplicate ", issue.related_id,
					" (", issue.detail, "): \"", unit.text,
					"\". Accept to keep it, reject to drop it, or send a revised text.");
		} else {
			question.prompt = absl::StrCat("Requirement ", unit.id, " needs clarification (", issue.detail,
					"): \"", unit.text, "\". Accept as is, reject, or send a revised text.");
		}
		question.options = {kAccept, kReject};
		absl::Status opened = gate_.Open(question);
		if (!opened.ok()) return FatalCallError(opened.message());
		question_ids.push_back(question.question_id);
	}

	// Questions of one item share a single deadline.
	const auto deadline = std::chrono::steady_clock::now() + timeout_;
	std::vector<std::string> notes;
	result.verdict = Verdict::Pass;
	for (const auto& question_id : question_ids) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
				deadline - std::chrono::steady_clock::now());
		ClarificationAnswer answer = gate_.Await(question_id,
				std::max(remaining, std::chrono::milliseconds(0)), token);
		if (answer.cancelled) {
			return token.IsCancelled() ? token.status() : CancelledError("question withdrawn");
		}
		if (answer.timed_out) {
			result.verdict = Verdict::Fail;
			notes.push_back(absl::StrCat(question_id, ": no answer, manual review"));
		} else if (answer.value == kReject) {
			result.verdict = Verdict::Fail;
			notes.push_back(absl::StrCat(question_id, ": rejected"));
		} else if (answer.value == kAccept) {
			notes.push_back(absl::StrCat(question_id, ": accepted"));
		} else {
			result.artifact.revised_text = answer.value;
			notes.push_back(absl::StrCat(question_id, ": revised"));
		}
	}
	result.detail = absl::StrJoin(notes, "; ");
	return result;
}

std::unique_ptr<PhaseHandler> MakePhaseHandler(Phase phase, const PhaseContext& context) {
	switch (phase) {
		case Phase::Mining:
			return std::make_unique<MiningHandler>(*context.capability);
		case Phase::KGBuild:
			return std::make_unique<GraphHandler>(*context.capability);
		case Phase::Validating:
			return std::make_unique<ValidationHandler>(*context.capability, context.config.pass_threshold);
		case Phase::Rewriting:
			return std::make_unique<RewriteHandler>(*context.capability, context.config.pass_threshold);
		case Phase::QAReview:
			return std::make_unique<QualityReviewHandler>(*context.capability, context.config,
					context.run_items);
		case Phase::Clarification:
			return std::make_unique<ClarificationHandler>(*context.gate, context.correlation_id,
					context.issues, context.config.clarification_timeout);
		default:
			return nullptr;
	}
}

} // namespace Reqflow
