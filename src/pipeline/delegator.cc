#include "delegator.h"

#include <glog/logging.h>
#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "events/event_broadcaster.h"
#include "result_aggregator.h"
#include "task_queue.h"

namespace Reqflow {

namespace {

PhaseOutcome ToOutcome(Phase phase, const ItemResult<HandlerResult>& result) {
	PhaseOutcome outcome;
	outcome.phase = phase;
	outcome.attempts = result.attempts;
	if (result.value.ok()) {
		outcome.verdict = result.value->verdict;
		outcome.score = result.value->score;
		outcome.detail = result.value->detail;
	} else {
		outcome.verdict = Verdict::Error;
		outcome.detail = result.value.status().ToString();
	}
	return outcome;
}

} // namespace

const char* DelegatorName(Phase phase) {
	switch (phase) {
		case Phase::Mining: return "MiningDelegator";
		case Phase::KGBuild: return "KnowledgeGraphDelegator";
		case Phase::Validating: return "ValidationDelegator";
		case Phase::Rewriting: return "RewriteDelegator";
		case Phase::QAReview: return "QualityReviewDelegator";
		case Phase::Clarification: return "ClarificationDelegator";
		default: return "Orchestrator";
	}
}

Delegator::Delegator(std::string correlation_id, PhaseHandler& handler, PoolOptions options,
		EventBroadcaster* events)
	: correlation_id_(std::move(correlation_id)),
	  handler_(handler),
	  pool_(std::move(options)),
	  events_(events) {}

void Delegator::Emit(EventPayload payload) {
	payload["agent"] = DelegatorName(handler_.phase());
	payload["phase"] = PhaseName(handler_.phase());
	if (events_ == nullptr) return;
	auto seq = events_->Publish(correlation_id_, EventKind::AgentMessage, std::move(payload));
	if (!seq.ok()) {
		VLOG(1) << "[" << correlation_id_ << "] progress event dropped: " << seq.status();
	}
}

PhaseResult Delegator::RunPhase(const std::vector<RequirementItem>& units,
		const CancellationToken& token) {
	const Phase phase = handler_.phase();
	const auto start = std::chrono::steady_clock::now();

	std::vector<WorkItem<RequirementItem>> work;
	work.reserve(units.size());
	absl::flat_hash_map<std::string, double> prior_scores;
	for (const auto& unit : units) {
		if (unit.current_score.has_value()) prior_scores[unit.id] = *unit.current_score;
		work.push_back(WorkItem<RequirementItem>{unit.id, unit});
	}

	auto queue = TaskQueue<RequirementItem>::Build(std::move(work));
	if (!queue.ok()) {
		LOG(ERROR) << "[" << correlation_id_ << "] " << PhaseName(phase)
			<< " rejected its work units: " << queue.status();
		PhaseResult result;
		result.phase = phase;
		result.stats.total = units.size();
		result.stats.errored = units.size();
		for (const auto& unit : units) {
			PhaseOutcome outcome;
			outcome.phase = phase;
			outcome.verdict = Verdict::Error;
			outcome.detail = queue.status().ToString();
			result.outcomes.emplace(unit.id, std::move(outcome));
		}
		Emit({{"status", "failed"}, {"detail", std::string(queue.status().message())}});
		return result;
	}

	ResultAggregator aggregator(phase, queue->Ids(), std::move(prior_scores));
	Emit({{"status", "started"}, {"total", absl::StrCat(queue->size())}});
	LOG(INFO) << "[" << correlation_id_ << "] " << DelegatorName(phase) << " started with "
		<< queue->size() << " units, max_concurrent=" << pool_.options().max_concurrent;

	auto handle = [this](const WorkItem<RequirementItem>& item, const CancellationToken& item_token) {
		return handler_.Handle(item.payload, item_token);
	};
	auto on_complete = [&](const std::string& id, const ItemResult<HandlerResult>& result) {
		PhaseOutcome outcome = ToOutcome(phase, result);
		const Verdict verdict = outcome.verdict;
		const std::optional<double> score = outcome.score;
		PhaseArtifact artifact;
		if (result.value.ok()) artifact = result.value->artifact;
		auto counters = aggregator.Record(id, std::move(outcome), std::move(artifact));
		if (!counters.has_value()) {
			LOG(WARNING) << "[" << correlation_id_ << "] duplicate outcome for " << id << " ignored";
			return;
		}
		EventPayload payload = {
			{"status", "progress"},
			{"item_id", id},
			{"verdict", VerdictName(verdict)},
			{"attempts", absl::StrCat(result.attempts)},
			{"completed", absl::StrCat(counters->completed)},
			{"total", absl::StrCat(counters->total)},
			{"passed", absl::StrCat(counters->passed)},
			{"failed", absl::StrCat(counters->failed)},
			{"errored", absl::StrCat(counters->errored)},
		};
		if (score.has_value()) payload["score"] = absl::StrFormat("%.3f", *score);
		if (!result.value.ok()) payload["error"] = std::string(result.value.status().message());
		VLOG(2) << "[" << correlation_id_ << "] " << PhaseName(phase) << " " << id << " -> "
			<< VerdictName(verdict) << " (" << counters->completed << "/" << counters->total << ")";
		Emit(std::move(payload));
	};

	pool_.Run(*queue, handle, token, on_complete);

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start);
	PhaseResult result = aggregator.Finalize(elapsed);
	const PhaseStats& stats = result.stats;
	Emit({
		{"status", "finished"},
		{"total", absl::StrCat(stats.total)},
		{"passed", absl::StrCat(stats.passed)},
		{"failed", absl::StrCat(stats.failed)},
		{"errored", absl::StrCat(stats.errored)},
		{"improved", absl::StrCat(stats.improved)},
		{"avg_score", absl::StrFormat("%.3f", stats.avg_score)},
		{"elapsed_ms", absl::StrCat(elapsed.count())},
	});
	LOG(INFO) << "[" << correlation_id_ << "] " << DelegatorName(phase) << " finished in "
		<< elapsed.count() << "ms: passed=" << stats.passed << " failed=" << stats.failed
		<< " errored=" << stats.errored << " max_in_flight=" << pool_.MaxObservedInFlight();
	return result;
}

} // namespace Reqflow
