#include "workflow_service.h"

#include <chrono>

#include "absl/strings/str_cat.h"

namespace Reqflow {

namespace {

constexpr std::chrono::milliseconds kStreamPollInterval{100};

int64_t ToMillis(std::chrono::system_clock::time_point tp) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

reqflow_rpc::Phase ToProto(Phase phase) {
	return static_cast<reqflow_rpc::Phase>(static_cast<int>(phase));
}

reqflow_rpc::Verdict ToProto(std::optional<Verdict> verdict) {
	if (!verdict.has_value()) return reqflow_rpc::VERDICT_UNSET;
	switch (*verdict) {
		case Verdict::Pass: return reqflow_rpc::VERDICT_PASS;
		case Verdict::Fail: return reqflow_rpc::VERDICT_FAIL;
		case Verdict::Error: return reqflow_rpc::VERDICT_ERROR;
	}
	return reqflow_rpc::VERDICT_UNSET;
}

void FillRequirement(const RequirementItem& item, reqflow_rpc::Requirement* out) {
	out->set_id(item.id);
	out->set_text(item.text);
	out->set_source_ref(item.source_ref);
	if (item.current_score.has_value()) {
		out->set_has_score(true);
		out->set_score(*item.current_score);
	}
	out->set_verdict(ToProto(item.verdict));
	for (const auto& outcome : item.history) {
		auto* h = out->add_history();
		h->set_phase(ToProto(outcome.phase));
		if (outcome.score.has_value()) {
			h->set_has_score(true);
			h->set_score(*outcome.score);
		}
		h->set_verdict(ToProto(std::optional<Verdict>(outcome.verdict)));
		h->set_detail(outcome.detail);
		h->set_attempts(outcome.attempts);
	}
}

} // namespace

WorkflowConfig MergeRunOptions(const reqflow_rpc::RunOptions& options, const WorkflowConfig& defaults) {
	WorkflowConfig config = defaults;
	for (const auto& [key, limit] : options.max_concurrent()) {
		auto phase = PhaseFromConfigKey(key);
		if (!phase.has_value()) {
			LOG(WARNING) << "Ignoring max_concurrent for unknown phase '" << key << "'";
			continue;
		}
		config.max_concurrent_per_phase[*phase] = limit;
	}
	if (options.per_item_timeout_ms() > 0) {
		config.per_item_timeout = std::chrono::milliseconds(options.per_item_timeout_ms());
	}
	if (options.max_attempts() > 0) config.max_attempts = options.max_attempts();
	if (options.retry_backoff_ms() > 0) {
		config.retry_backoff = std::chrono::milliseconds(options.retry_backoff_ms());
	}
	if (options.clarification_timeout_ms() > 0) {
		config.clarification_timeout = std::chrono::milliseconds(options.clarification_timeout_ms());
	}
	if (options.pass_threshold() > 0.0) config.pass_threshold = options.pass_threshold();
	if (options.max_rewrite_rounds() > 0) config.max_rewrite_rounds = options.max_rewrite_rounds();
	if (options.duplicate_threshold() > 0.0) config.duplicate_threshold = options.duplicate_threshold();
	if (options.search_top_k() > 0) config.search_top_k = options.search_top_k();
	return config;
}

reqflow_rpc::WorkflowEvent ToProto(const WorkflowEvent& event) {
	reqflow_rpc::WorkflowEvent out;
	out.set_correlation_id(event.correlation_id);
	out.set_sequence_number(event.sequence_number);
	out.set_kind(static_cast<reqflow_rpc::EventKind>(static_cast<int>(event.kind)));
	for (const auto& [key, value] : event.payload) {
		(*out.mutable_payload())[key] = value;
	}
	out.set_timestamp_ms(ToMillis(event.timestamp));
	return out;
}

reqflow_rpc::RunSnapshot ToProto(const WorkflowRun& run) {
	reqflow_rpc::RunSnapshot out;
	out.set_correlation_id(run.correlation_id);
	out.set_phase(ToProto(run.phase));
	if (run.failure_reason != FailureReason::None) {
		out.set_failure_reason(FailureReasonName(run.failure_reason));
		out.set_failure_detail(run.failure_detail);
	}
	for (const auto& item : run.items) {
		FillRequirement(item, out.add_requirements());
	}
	out.set_graph_nodes(static_cast<int32_t>(run.graph.nodes.size()));
	out.set_graph_edges(static_cast<int32_t>(run.graph.edges.size()));
	for (const auto& question : run.questions) {
		auto* q = out.add_questions();
		q->set_question_id(question.question_id);
		q->set_item_id(question.item_id);
		q->set_issue(IssueKindName(question.issue));
		q->set_prompt(question.prompt);
	}
	out.set_started_at_ms(ToMillis(run.started_at));
	if (run.ended_at.has_value()) out.set_ended_at_ms(ToMillis(*run.ended_at));
	return out;
}

RequirementItem FromProto(const reqflow_rpc::Requirement& requirement) {
	RequirementItem item;
	item.id = requirement.id();
	item.text = requirement.text();
	item.source_ref = requirement.source_ref();
	if (requirement.has_score()) item.current_score = requirement.score();
	switch (requirement.verdict()) {
		case reqflow_rpc::VERDICT_PASS: item.verdict = Verdict::Pass; break;
		case reqflow_rpc::VERDICT_FAIL: item.verdict = Verdict::Fail; break;
		case reqflow_rpc::VERDICT_ERROR: item.verdict = Verdict::Error; break;
		default: break;
	}
	return item;
}

Status WorkflowServiceImpl::Submit(ServerContext* context, const reqflow_rpc::SubmitRequest* request,
		reqflow_rpc::SubmitResponse* response) {
	WorkflowRequest run_request;
	for (const auto& document : request->documents()) {
		run_request.documents.push_back({document.id(), document.text(), document.source_ref()});
	}
	for (const auto& requirement : request->requirements()) {
		run_request.items.push_back(FromProto(requirement));
	}
	WorkflowConfig config = MergeRunOptions(request->options(), defaults_);

	std::string detail;
	SubmitStatus status = orchestrator_.Submit(request->correlation_id(), std::move(run_request),
			std::move(config), &detail);
	switch (status) {
		case SubmitStatus::kAccepted:
			response->set_result(reqflow_rpc::SubmitResponse::ACCEPTED);
			break;
		case SubmitStatus::kRejectedDuplicate:
			response->set_result(reqflow_rpc::SubmitResponse::REJECTED_DUPLICATE);
			break;
		case SubmitStatus::kRejectedInvalid:
			response->set_result(reqflow_rpc::SubmitResponse::REJECTED_INVALID);
			break;
	}
	response->set_detail(detail);
	VLOG(1) << "Submit " << request->correlation_id() << " from " << context->peer() << ": "
		<< SubmitStatusName(status);
	return Status::OK;
}

Status WorkflowServiceImpl::Cancel(ServerContext* context, const reqflow_rpc::CancelRequest* request,
		reqflow_rpc::CancelResponse* response) {
	CancelStatus status = orchestrator_.Cancel(request->correlation_id());
	response->set_result(status == CancelStatus::kOk
			? reqflow_rpc::CancelResponse::OK
			: reqflow_rpc::CancelResponse::NOT_FOUND);
	VLOG(1) << "Cancel " << request->correlation_id() << " from " << context->peer() << ": "
		<< CancelStatusName(status);
	return Status::OK;
}

Status WorkflowServiceImpl::AnswerClarification(ServerContext* context,
		const reqflow_rpc::AnswerRequest* request, reqflow_rpc::AnswerResponse* response) {
	AnswerStatus status = orchestrator_.AnswerClarification(request->correlation_id(),
			request->question_id(), request->value());
	switch (status) {
		case AnswerStatus::kOk:
			response->set_result(reqflow_rpc::AnswerResponse::OK);
			break;
		case AnswerStatus::kAlreadyAnswered:
			response->set_result(reqflow_rpc::AnswerResponse::ALREADY_ANSWERED);
			break;
		case AnswerStatus::kNotFound:
			response->set_result(reqflow_rpc::AnswerResponse::NOT_FOUND);
			break;
	}
	VLOG(1) << "Answer " << request->question_id() << " from " << context->peer() << ": "
		<< AnswerStatusName(status);
	return Status::OK;
}

Status WorkflowServiceImpl::Subscribe(ServerContext* context,
		const reqflow_rpc::SubscribeRequest* request,
		ServerWriter<reqflow_rpc::WorkflowEvent>* writer) {
	auto subscription = orchestrator_.Subscribe(request->correlation_id());
	if (!subscription.ok()) {
		return Status(grpc::StatusCode::NOT_FOUND, std::string(subscription.status().message()));
	}
	LOG(INFO) << "Subscriber " << context->peer() << " attached to " << request->correlation_id();

	std::shared_ptr<EventSubscription> events = *subscription;
	size_t written = 0;
	while (!context->IsCancelled()) {
		auto event = events->Next(kStreamPollInterval);
		if (event.has_value()) {
			if (!writer->Write(ToProto(*event))) break;
			written++;
			continue;
		}
		if (events->Finished()) break;
	}
	events->Cancel();
	LOG(INFO) << "Subscriber " << context->peer() << " detached from " << request->correlation_id()
		<< " after " << written << " events";
	return Status::OK;
}

Status WorkflowServiceImpl::GetRun(ServerContext* context, const reqflow_rpc::GetRunRequest* request,
		reqflow_rpc::RunSnapshot* response) {
	auto run = orchestrator_.Snapshot(request->correlation_id());
	if (!run.has_value()) {
		return Status(grpc::StatusCode::NOT_FOUND,
				absl::StrCat("no run for ", request->correlation_id()));
	}
	*response = ToProto(*run);
	VLOG(2) << "GetRun " << request->correlation_id() << " from " << context->peer();
	return Status::OK;
}

} // namespace Reqflow
