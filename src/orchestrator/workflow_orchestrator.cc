#include "workflow_orchestrator.h"

#include <glog/logging.h>
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"

#include "common/call_status.h"
#include "pipeline/delegator.h"

namespace Reqflow {

namespace {

// Issues flagged by the most recent quality review, keyed by item id.
absl::btree_map<std::string, std::vector<QualityIssue>> OpenIssues(const WorkflowRun& run) {
	absl::btree_map<std::string, std::vector<QualityIssue>> issues;
	for (auto it = run.phase_results.rbegin(); it != run.phase_results.rend(); ++it) {
		if (it->phase != Phase::QAReview) continue;
		for (const auto& [id, artifact] : it->artifacts) {
			if (!artifact.issues.empty()) issues[id] = artifact.issues;
		}
		break;
	}
	return issues;
}

EventPayload ResultPayload(const WorkflowRun& run) {
	size_t passed = 0, failed = 0, errored = 0, scored = 0;
	double mean = 0.0;
	for (const auto& item : run.items) {
		if (item.verdict.has_value()) {
			switch (*item.verdict) {
				case Verdict::Pass: passed++; break;
				case Verdict::Fail: failed++; break;
				case Verdict::Error: errored++; break;
			}
		}
		if (item.current_score.has_value()) {
			scored++;
			mean += (*item.current_score - mean) / static_cast<double>(scored);
		}
	}
	auto end = run.ended_at.value_or(std::chrono::system_clock::now());
	EventPayload payload = {
		{"status", run.phase == Phase::Completed ? "completed" : "failed"},
		{"phase", PhaseName(run.phase)},
		{"items", absl::StrCat(run.items.size())},
		{"passed", absl::StrCat(passed)},
		{"failed", absl::StrCat(failed)},
		{"errored", absl::StrCat(errored)},
		{"avg_score", absl::StrFormat("%.3f", mean)},
		{"phases_run", absl::StrCat(run.phase_results.size())},
		{"questions", absl::StrCat(run.questions.size())},
		{"graph_nodes", absl::StrCat(run.graph.nodes.size())},
		{"graph_edges", absl::StrCat(run.graph.edges.size())},
		{"elapsed_ms", absl::StrCat(std::chrono::duration_cast<std::chrono::milliseconds>(
				end - run.started_at).count())},
	};
	if (run.failure_reason != FailureReason::None) {
		payload["reason"] = FailureReasonName(run.failure_reason);
		payload["detail"] = run.failure_detail;
	}
	return payload;
}

} // namespace

const char* SubmitStatusName(SubmitStatus status) {
	switch (status) {
		case SubmitStatus::kAccepted: return "accepted";
		case SubmitStatus::kRejectedDuplicate: return "rejected-duplicate";
		case SubmitStatus::kRejectedInvalid: return "rejected-invalid";
	}
	return "unknown";
}

const char* CancelStatusName(CancelStatus status) {
	return status == CancelStatus::kOk ? "ok" : "not-found";
}

WorkflowOrchestrator::WorkflowOrchestrator(RequirementsCapability& capability,
		OrchestratorOptions options)
	: capability_(capability),
	  options_(options),
	  events_(options.replay_buffer),
	  gate_(&events_) {
	reaper_thread_ = std::thread([this]() {
			this->ReapLoop();
			});
}

WorkflowOrchestrator::~WorkflowOrchestrator() {
	Shutdown();
}

SubmitStatus WorkflowOrchestrator::Submit(const std::string& correlation_id, WorkflowRequest request,
		WorkflowConfig config, std::string* detail) {
	auto reject = [&](const std::string& why) {
		if (detail != nullptr) *detail = why;
		LOG(WARNING) << "[" << correlation_id << "] submission rejected: " << why;
		return SubmitStatus::kRejectedInvalid;
	};

	if (correlation_id.empty()) return reject("empty correlation id");
	auto errors = config.Validate();
	if (!errors.empty()) return reject(absl::StrJoin(errors, "; "));
	if (request.documents.empty() && request.items.empty()) {
		return reject("no documents and no requirements");
	}
	absl::flat_hash_set<std::string> ids;
	for (const auto& item : request.items) {
		if (item.id.empty()) return reject("requirement with empty id");
		if (!ids.insert(item.id).second) return reject(absl::StrCat("duplicate requirement id ", item.id));
	}
	ids.clear();
	for (const auto& document : request.documents) {
		if (document.id.empty()) return reject("document with empty id");
		if (!ids.insert(document.id).second) return reject(absl::StrCat("duplicate document id ", document.id));
	}

	absl::MutexLock lifecycle(&lifecycle_mu_);
	if (shutdown_) return reject("orchestrator is shutting down");

	// Released after the lock on the registry is gone; joins a finished driver.
	std::shared_ptr<Session> replaced;
	auto session = sessions_.Create(correlation_id, std::move(config), &replaced);
	if (!session.ok()) {
		if (detail != nullptr) *detail = absl::StrCat("run ", correlation_id, " is still active");
		LOG(WARNING) << "[" << correlation_id << "] duplicate submission rejected";
		return SubmitStatus::kRejectedDuplicate;
	}

	gate_.Forget(correlation_id);
	events_.OpenChannel(correlation_id);
	{
		Session& s = **session;
		absl::MutexLock lock(&s.mu);
		s.documents = std::move(request.documents);
		s.run.correlation_id = correlation_id;
		s.run.phase = Phase::Pending;
		s.run.items = std::move(request.items);
		s.run.started_at = std::chrono::system_clock::now();
		Publish(s, EventKind::WorkflowStatus, {
			{"phase", PhaseName(Phase::Pending)},
			{"status", "accepted"},
			{"documents", absl::StrCat(s.documents.size())},
			{"items", absl::StrCat(s.run.items.size())},
		});
	}
	LOG(INFO) << "[" << correlation_id << "] accepted run";
	(*session)->driver = std::thread(&WorkflowOrchestrator::Drive, this, *session);
	return SubmitStatus::kAccepted;
}

CancelStatus WorkflowOrchestrator::Cancel(const std::string& correlation_id) {
	auto session = sessions_.Find(correlation_id);
	if (!session) return CancelStatus::kNotFound;
	{
		absl::MutexLock lock(&session->mu);
		if (IsTerminal(session->run.phase)) return CancelStatus::kNotFound;
		Fail(*session, FailureReason::Cancelled, "cancelled by caller");
	}
	session->token.Cancel(CancelledError("cancelled by caller"));
	gate_.CancelAll(correlation_id);
	return CancelStatus::kOk;
}

AnswerStatus WorkflowOrchestrator::AnswerClarification(const std::string& correlation_id,
		const std::string& question_id, const std::string& value) {
	return gate_.Answer(correlation_id, question_id, value);
}

absl::StatusOr<std::shared_ptr<EventSubscription>> WorkflowOrchestrator::Subscribe(
		const std::string& correlation_id) {
	return events_.Subscribe(correlation_id);
}

std::optional<WorkflowRun> WorkflowOrchestrator::WaitForResult(const std::string& correlation_id,
		std::chrono::milliseconds timeout) {
	auto session = sessions_.Find(correlation_id);
	if (!session) return std::nullopt;
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	absl::MutexLock lock(&session->mu);
	while (!session->finished) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) return std::nullopt;
		session->done_cv.WaitWithTimeout(&session->mu, absl::FromChrono(deadline - now));
	}
	return session->run;
}

std::optional<WorkflowRun> WorkflowOrchestrator::Snapshot(const std::string& correlation_id) const {
	auto session = sessions_.Find(correlation_id);
	if (!session) return std::nullopt;
	absl::MutexLock lock(&session->mu);
	return session->run;
}

void WorkflowOrchestrator::Shutdown() {
	{
		absl::MutexLock lifecycle(&lifecycle_mu_);
		if (shutdown_) return;
		shutdown_ = true;
		shutdown_cv_.SignalAll();
	}
	if (reaper_thread_.joinable()) {
		reaper_thread_.join();
	}
	auto sessions = sessions_.Clear();
	for (auto& session : sessions) {
		session->token.Cancel(CancelledError("orchestrator shutting down"));
		gate_.CancelAll(session->correlation_id);
	}
	for (auto& session : sessions) {
		if (session->driver.joinable()) session->driver.join();
	}
	LOG(INFO) << "Orchestrator stopped, " << sessions.size() << " sessions released";
}

void WorkflowOrchestrator::Drive(std::shared_ptr<Session> session) {
	const std::string& cid = session->correlation_id;
	{
		absl::MutexLock lock(&session->mu);
		if (!IsTerminal(session->run.phase)) {
			Advance(*session, NextPhase(TransitionInput{Phase::Pending}));
		}
	}

	while (true) {
		Phase phase;
		std::vector<RequirementItem> units;
		PhaseContext context;
		{
			absl::MutexLock lock(&session->mu);
			phase = session->run.phase;
			if (IsTerminal(phase)) break;
			units = UnitsFor(*session, phase);
			context = ContextFor(*session, phase);
		}

		std::unique_ptr<PhaseHandler> handler = MakePhaseHandler(phase, context);
		if (!handler) {
			absl::MutexLock lock(&session->mu);
			if (!IsTerminal(session->run.phase)) {
				Fail(*session, FailureReason::PhaseExhausted,
						absl::StrCat("no handler for phase ", PhaseName(phase)));
			}
			break;
		}
		Delegator delegator(cid, *handler, PoolOptionsFor(*session, phase), &events_);
		PhaseResult result = delegator.RunPhase(units, session->token);

		absl::MutexLock lock(&session->mu);
		// Cancelled while the phase ran: nothing is applied and no phase follows.
		if (IsTerminal(session->run.phase)) break;
		if (session->token.IsCancelled()) {
			Fail(*session, FailureReason::Cancelled, std::string(session->token.status().message()));
			break;
		}
		Apply(*session, result);
		if (phase == Phase::Rewriting) session->rewrite_rounds++;

		TransitionInput input;
		input.current = phase;
		input.result = &session->run.phase_results.back();
		input.item_count = session->run.items.size();
		input.rewrite_rounds = session->rewrite_rounds;
		input.max_rewrite_rounds = session->config.max_rewrite_rounds;
		Advance(*session, NextPhase(input));
	}
	Finish(*session);
}

std::vector<RequirementItem> WorkflowOrchestrator::UnitsFor(Session& session, Phase phase) {
	std::vector<RequirementItem> units;
	const WorkflowRun& run = session.run;
	switch (phase) {
		case Phase::Mining:
			for (const auto& document : session.documents) {
				RequirementItem unit;
				unit.id = document.id;
				unit.text = document.text;
				unit.source_ref = document.source_ref;
				units.push_back(std::move(unit));
			}
			break;
		case Phase::Rewriting:
			for (const auto& item : run.items) {
				if (item.verdict == Verdict::Fail) units.push_back(item);
			}
			break;
		case Phase::Clarification: {
			auto issues = OpenIssues(run);
			for (const auto& item : run.items) {
				if (issues.contains(item.id)) units.push_back(item);
			}
			break;
		}
		default:
			units = run.items;
			break;
	}
	return units;
}

PhaseContext WorkflowOrchestrator::ContextFor(Session& session, Phase phase) {
	PhaseContext context;
	context.correlation_id = session.correlation_id;
	context.config = session.config;
	context.capability = &capability_;
	context.gate = &gate_;
	if (phase == Phase::QAReview) context.run_items = session.run.items;
	if (phase == Phase::Clarification) context.issues = OpenIssues(session.run);
	return context;
}

PoolOptions WorkflowOrchestrator::PoolOptionsFor(const Session& session, Phase phase) const {
	const WorkflowConfig& config = session.config;
	PoolOptions options;
	options.max_concurrent = config.MaxConcurrent(phase);
	options.per_item_timeout = config.per_item_timeout;
	options.max_attempts = config.max_attempts;
	options.retry_backoff = config.retry_backoff;
	options.name = absl::StrCat(session.correlation_id, "/", PhaseConfigKey(phase));
	if (phase == Phase::Clarification) {
		// A human answers once; the gate enforces clarification_timeout itself.
		options.per_item_timeout = config.clarification_timeout + options_.clarification_slack;
		options.max_attempts = 1;
	}
	return options;
}

void WorkflowOrchestrator::Apply(Session& session, const PhaseResult& result) {
	WorkflowRun& run = session.run;
	run.phase_results.push_back(result);

	if (result.phase == Phase::Mining) {
		absl::flat_hash_set<std::string> ids;
		for (const auto& item : run.items) ids.insert(item.id);
		size_t added = 0;
		for (const auto& [document_id, artifact] : result.artifacts) {
			const PhaseOutcome& source = result.outcomes.at(document_id);
			for (RequirementItem mined : artifact.mined_items) {
				std::string id = mined.id;
				for (int suffix = 2; !ids.insert(id).second; suffix++) {
					id = absl::StrCat(mined.id, "~", suffix);
				}
				mined.id = std::move(id);
				PhaseOutcome outcome;
				outcome.phase = Phase::Mining;
				outcome.verdict = Verdict::Pass;
				outcome.detail = absl::StrCat("mined from ", document_id);
				outcome.attempts = source.attempts;
				mined.history.push_back(std::move(outcome));
				run.items.push_back(std::move(mined));
				added++;
			}
		}
		VLOG(1) << "[" << session.correlation_id << "] mining added " << added << " requirements";
		return;
	}

	absl::flat_hash_map<std::string, size_t> index;
	for (size_t i = 0; i < run.items.size(); i++) index.emplace(run.items[i].id, i);

	std::vector<const KnowledgeGraph*> fragments;
	for (const auto& [id, outcome] : result.outcomes) {
		auto pos = index.find(id);
		if (pos == index.end()) continue;
		RequirementItem& item = run.items[pos->second];
		item.history.push_back(outcome);
		if (result.phase != Phase::KGBuild) item.verdict = outcome.verdict;
		if (outcome.verdict == Verdict::Error) continue;
		if (outcome.score.has_value()) item.current_score = outcome.score;

		auto artifact = result.artifacts.find(id);
		if (artifact == result.artifacts.end()) continue;
		if (artifact->second.revised_text.has_value()) item.text = *artifact->second.revised_text;
		if (result.phase == Phase::KGBuild) fragments.push_back(&artifact->second.graph);
	}
	if (!fragments.empty()) run.graph.MergeAll(fragments);

	if (result.phase == Phase::Clarification) {
		for (const auto& [item_id, issues] : OpenIssues(run)) {
			for (const auto& issue : issues) {
				ClarificationQuestion question;
				question.question_id = ClarificationHandler::QuestionId(session.correlation_id, item_id, issue);
				question.correlation_id = session.correlation_id;
				question.item_id = item_id;
				question.issue = issue.kind;
				question.prompt = issue.detail;
				question.options = {ClarificationHandler::kAccept, ClarificationHandler::kReject};
				run.questions.push_back(std::move(question));
			}
		}
	}
}

void WorkflowOrchestrator::Advance(Session& session, const Transition& transition) {
	if (transition.next == Phase::Failed) {
		Fail(session, transition.reason, transition.detail);
		return;
	}
	const Phase previous = session.run.phase;
	session.run.phase = transition.next;
	if (transition.next == Phase::Completed) session.run.ended_at = std::chrono::system_clock::now();

	LOG(INFO) << "[" << session.correlation_id << "] " << PhaseName(previous) << " -> "
		<< PhaseName(transition.next);
	EventPayload payload = {
		{"phase", PhaseName(transition.next)},
		{"previous", PhaseName(previous)},
	};
	if (transition.next == Phase::Rewriting) {
		payload["round"] = absl::StrCat(session.rewrite_rounds + 1);
	}
	Publish(session, EventKind::WorkflowStatus, std::move(payload));
}

void WorkflowOrchestrator::Fail(Session& session, FailureReason reason, const std::string& detail) {
	const Phase previous = session.run.phase;
	session.run.phase = Phase::Failed;
	session.run.failure_reason = reason;
	session.run.failure_detail = detail;
	session.run.ended_at = std::chrono::system_clock::now();

	LOG(WARNING) << "[" << session.correlation_id << "] " << PhaseName(previous) << " -> Failed ("
		<< FailureReasonName(reason) << "): " << detail;
	Publish(session, EventKind::WorkflowStatus, {
		{"phase", PhaseName(Phase::Failed)},
		{"previous", PhaseName(previous)},
		{"reason", FailureReasonName(reason)},
		{"detail", detail},
	});
}

void WorkflowOrchestrator::Finish(Session& session) {
	absl::MutexLock lock(&session.mu);
	if (!IsTerminal(session.run.phase)) {
		Fail(session, FailureReason::PhaseExhausted, "driver stopped before a terminal phase");
	}
	if (!session.run.ended_at.has_value()) session.run.ended_at = std::chrono::system_clock::now();
	Publish(session, EventKind::WorkflowResult, ResultPayload(session.run));
	events_.CloseChannel(session.correlation_id);
	session.finished = true;
	session.done_cv.SignalAll();
	LOG(INFO) << "[" << session.correlation_id << "] run finished in phase "
		<< PhaseName(session.run.phase) << " with " << session.run.items.size() << " requirements";
}

void WorkflowOrchestrator::Publish(Session& session, EventKind kind, EventPayload payload) {
	auto seq = events_.Publish(session.correlation_id, kind, std::move(payload));
	if (!seq.ok()) {
		LOG(WARNING) << "[" << session.correlation_id << "] " << EventKindName(kind)
			<< " event dropped: " << seq.status();
	}
}

void WorkflowOrchestrator::ReapLoop() {
	while (true) {
		{
			absl::MutexLock lifecycle(&lifecycle_mu_);
			if (!shutdown_) {
				shutdown_cv_.WaitWithTimeout(&lifecycle_mu_, absl::FromChrono(options_.reap_interval));
			}
			if (shutdown_) return;
		}
		for (const auto& correlation_id : events_.ReapIdleChannels(options_.channel_grace)) {
			auto session = sessions_.EraseFinished(correlation_id);
			if (!session) continue;
			gate_.Forget(correlation_id);
			VLOG(1) << "[" << correlation_id << "] session dropped after grace period";
		}
	}
}

} // namespace Reqflow
