#include "result_aggregator.h"

namespace Reqflow {

ResultAggregator::ResultAggregator(Phase phase, std::vector<std::string> ordered_ids,
		absl::flat_hash_map<std::string, double> prior_scores)
	: phase_(phase),
	  ordered_ids_(std::move(ordered_ids)),
	  known_ids_(ordered_ids_.begin(), ordered_ids_.end()),
	  prior_scores_(std::move(prior_scores)) {
	counters_.total = ordered_ids_.size();
	recorded_.reserve(ordered_ids_.size());
}

std::optional<ProgressCounters> ResultAggregator::Record(const std::string& id,
		PhaseOutcome outcome, PhaseArtifact artifact) {
	absl::MutexLock lock(&mu_);
	if (recorded_.contains(id)) return std::nullopt;
	if (!known_ids_.contains(id)) return std::nullopt;
	outcome.phase = phase_;
	switch (outcome.verdict) {
		case Verdict::Pass: counters_.passed++; break;
		case Verdict::Fail: counters_.failed++; break;
		case Verdict::Error: counters_.errored++; break;
	}
	counters_.completed++;
	recorded_.emplace(id, Entry{std::move(outcome), std::move(artifact)});
	return counters_;
}

ProgressCounters ResultAggregator::Counters() const {
	absl::MutexLock lock(&mu_);
	return counters_;
}

PhaseResult ResultAggregator::Finalize(std::chrono::milliseconds elapsed) const {
	absl::MutexLock lock(&mu_);
	PhaseResult result;
	result.phase = phase_;
	result.elapsed = elapsed;

	PhaseStats& stats = result.stats;
	size_t scored = 0;
	double mean = 0.0;
	for (const auto& id : ordered_ids_) {
		stats.total++;
		auto it = recorded_.find(id);
		if (it == recorded_.end()) {
			PhaseOutcome missing;
			missing.phase = phase_;
			missing.verdict = Verdict::Error;
			missing.detail = "no outcome recorded";
			result.outcomes.emplace(id, std::move(missing));
			stats.errored++;
			continue;
		}
		const PhaseOutcome& outcome = it->second.outcome;
		switch (outcome.verdict) {
			case Verdict::Pass: stats.passed++; break;
			case Verdict::Fail: stats.failed++; break;
			case Verdict::Error: stats.errored++; break;
		}
		if (outcome.verdict != Verdict::Error && outcome.score.has_value()) {
			scored++;
			mean += (*outcome.score - mean) / static_cast<double>(scored);
			auto prior = prior_scores_.find(id);
			if (prior != prior_scores_.end() && *outcome.score > prior->second) {
				stats.improved++;
			}
		}
		result.outcomes.emplace(id, outcome);
		result.artifacts.emplace(id, it->second.artifact);
	}
	stats.avg_score = mean;
	return result;
}

} // namespace Reqflow
