#ifndef REQFLOW_WORKFLOW_SERVICE_H_
#define REQFLOW_WORKFLOW_SERVICE_H_

#include <string>

#include <glog/logging.h>
#include <grpcpp/grpcpp.h>
#include <workflow.grpc.pb.h>

#include "common/workflow_config.h"
#include "orchestrator/workflow_orchestrator.h"

namespace Reqflow {

using grpc::ServerContext;
using grpc::ServerWriter;
using grpc::Status;
using reqflow_rpc::WorkflowService;

// Per-run options from the wire; unset fields keep `defaults`.
WorkflowConfig MergeRunOptions(const reqflow_rpc::RunOptions& options, const WorkflowConfig& defaults);

reqflow_rpc::WorkflowEvent ToProto(const WorkflowEvent& event);
reqflow_rpc::RunSnapshot ToProto(const WorkflowRun& run);
RequirementItem FromProto(const reqflow_rpc::Requirement& requirement);

/**
 * gRPC front of a WorkflowOrchestrator.
 */
class WorkflowServiceImpl final : public WorkflowService::Service {
	public:
		WorkflowServiceImpl(WorkflowOrchestrator& orchestrator, WorkflowConfig defaults)
			: orchestrator_(orchestrator), defaults_(std::move(defaults)) {}

		Status Submit(ServerContext* context, const reqflow_rpc::SubmitRequest* request,
				reqflow_rpc::SubmitResponse* response) override;

		Status Cancel(ServerContext* context, const reqflow_rpc::CancelRequest* request,
				reqflow_rpc::CancelResponse* response) override;

		Status AnswerClarification(ServerContext* context, const reqflow_rpc::AnswerRequest* request,
				reqflow_rpc::AnswerResponse* response) override;

		// Streams until the run's channel closes or the client goes away.
		Status Subscribe(ServerContext* context, const reqflow_rpc::SubscribeRequest* request,
				ServerWriter<reqflow_rpc::WorkflowEvent>* writer) override;

		Status GetRun(ServerContext* context, const reqflow_rpc::GetRunRequest* request,
				reqflow_rpc::RunSnapshot* response) override;

	private:
		WorkflowOrchestrator& orchestrator_;
		const WorkflowConfig defaults_;
};

} // namespace Reqflow

#endif // REQFLOW_WORKFLOW_SERVICE_H_
