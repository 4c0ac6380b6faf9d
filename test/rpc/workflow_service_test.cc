#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "rpc/workflow_service.h"
#include "../orchestrator/fake_capability.h"

using namespace Reqflow;
using namespace std::chrono_literals;

TEST(MergeRunOptionsTest, UnsetFieldsKeepDefaults) {
	WorkflowConfig defaults;
	reqflow_rpc::RunOptions options;
	WorkflowConfig merged = MergeRunOptions(options, defaults);
	EXPECT_EQ(merged.max_attempts, defaults.max_attempts);
	EXPECT_DOUBLE_EQ(merged.pass_threshold, defaults.pass_threshold);
	EXPECT_EQ(merged.MaxConcurrent(Phase::Validating), 5);
}

TEST(MergeRunOptionsTest, SetFieldsOverride) {
	reqflow_rpc::RunOptions options;
	(*options.mutable_max_concurrent())["validating"] = 2;
	(*options.mutable_max_concurrent())["bogus"] = 9;
	options.set_pass_threshold(0.85);
	options.set_per_item_timeout_ms(1500);
	options.set_max_attempts(4);
	WorkflowConfig merged = MergeRunOptions(options, WorkflowConfig());
	EXPECT_EQ(merged.MaxConcurrent(Phase::Validating), 2);
	EXPECT_EQ(merged.MaxConcurrent(Phase::Mining), 8);
	EXPECT_DOUBLE_EQ(merged.pass_threshold, 0.85);
	EXPECT_EQ(merged.per_item_timeout, std::chrono::milliseconds(1500));
	EXPECT_EQ(merged.max_attempts, 4);
}

TEST(ProtoConversionTest, RunSnapshotCarriesItemsAndFailure) {
	WorkflowRun run;
	run.correlation_id = "run-1";
	run.phase = Phase::Failed;
	run.failure_reason = FailureReason::Cancelled;
	run.failure_detail = "cancelled by caller";
	RequirementItem item;
	item.id = "R1";
	item.text = "Operators must rotate keys";
	item.current_score = 0.8;
	item.verdict = Verdict::Pass;
	item.history.push_back({Phase::Validating, 0.8, Verdict::Pass, "all criteria met", 1});
	run.items.push_back(item);

	reqflow_rpc::RunSnapshot snapshot = ToProto(run);
	EXPECT_EQ(snapshot.phase(), reqflow_rpc::PHASE_FAILED);
	EXPECT_EQ(snapshot.failure_reason(), "Cancelled");
	ASSERT_EQ(snapshot.requirements_size(), 1);
	EXPECT_TRUE(snapshot.requirements(0).has_score());
	EXPECT_EQ(snapshot.requirements(0).verdict(), reqflow_rpc::VERDICT_PASS);
	EXPECT_EQ(snapshot.requirements(0).history(0).phase(), reqflow_rpc::PHASE_VALIDATING);

	RequirementItem back = FromProto(snapshot.requirements(0));
	EXPECT_EQ(back.id, "R1");
	EXPECT_EQ(back.verdict, Verdict::Pass);
}

class WorkflowServiceTest : public ::testing::Test {
protected:
	void SetUp() override {
		orchestrator_ = std::make_unique<WorkflowOrchestrator>(capability_);
		WorkflowConfig defaults;
		defaults.retry_backoff = std::chrono::milliseconds(0);
		service_ = std::make_unique<WorkflowServiceImpl>(*orchestrator_, defaults);

		int port = 0;
		grpc::ServerBuilder builder;
		builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
		builder.RegisterService(service_.get());
		server_ = builder.BuildAndStart();
		ASSERT_NE(server_, nullptr);
		ASSERT_GT(port, 0);
		stub_ = reqflow_rpc::WorkflowService::NewStub(grpc::CreateChannel(
					"127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));
	}

	void TearDown() override {
		server_->Shutdown();
		orchestrator_->Shutdown();
	}

	reqflow_rpc::SubmitResponse Submit(const std::string& correlation_id) {
		reqflow_rpc::SubmitRequest request;
		request.set_correlation_id(correlation_id);
		auto* requirement = request.add_requirements();
		requirement->set_id("R1");
		requirement->set_text("Operators must rotate signing keys monthly");
		auto* document = request.add_documents();
		document->set_id("doc");
		document->set_text("The system shall encrypt stored data");

		grpc::ClientContext context;
		reqflow_rpc::SubmitResponse response;
		EXPECT_TRUE(stub_->Submit(&context, request, &response).ok());
		return response;
	}

	FakeCapability capability_;
	std::unique_ptr<WorkflowOrchestrator> orchestrator_;
	std::unique_ptr<WorkflowServiceImpl> service_;
	std::unique_ptr<grpc::Server> server_;
	std::unique_ptr<reqflow_rpc::WorkflowService::Stub> stub_;
};

TEST_F(WorkflowServiceTest, SubmitStreamAndFetch) {
	ASSERT_EQ(Submit("run-1").result(), reqflow_rpc::SubmitResponse::ACCEPTED);

	grpc::ClientContext stream_context;
	reqflow_rpc::SubscribeRequest subscribe;
	subscribe.set_correlation_id("run-1");
	auto reader = stub_->Subscribe(&stream_context, subscribe);
	reqflow_rpc::WorkflowEvent event;
	uint64_t expected = 1;
	reqflow_rpc::WorkflowEvent last;
	while (reader->Read(&event)) {
		EXPECT_EQ(event.sequence_number(), expected++);
		last = event;
	}
	ASSERT_TRUE(reader->Finish().ok());
	EXPECT_EQ(last.kind(), reqflow_rpc::EVENT_WORKFLOW_RESULT);
	EXPECT_EQ(last.payload().at("status"), "completed");

	grpc::ClientContext context;
	reqflow_rpc::GetRunRequest get;
	get.set_correlation_id("run-1");
	reqflow_rpc::RunSnapshot snapshot;
	ASSERT_TRUE(stub_->GetRun(&context, get, &snapshot).ok());
	EXPECT_EQ(snapshot.phase(), reqflow_rpc::PHASE_COMPLETED);
	EXPECT_EQ(snapshot.requirements_size(), 2);
	EXPECT_GT(snapshot.ended_at_ms(), 0);
}

TEST_F(WorkflowServiceTest, RejectionsAndLookups) {
	reqflow_rpc::SubmitRequest empty;
	empty.set_correlation_id("run-empty");
	{
		grpc::ClientContext context;
		reqflow_rpc::SubmitResponse response;
		ASSERT_TRUE(stub_->Submit(&context, empty, &response).ok());
		EXPECT_EQ(response.result(), reqflow_rpc::SubmitResponse::REJECTED_INVALID);
		EXPECT_FALSE(response.detail().empty());
	}
	{
		grpc::ClientContext context;
		reqflow_rpc::CancelRequest request;
		request.set_correlation_id("ghost");
		reqflow_rpc::CancelResponse response;
		ASSERT_TRUE(stub_->Cancel(&context, request, &response).ok());
		EXPECT_EQ(response.result(), reqflow_rpc::CancelResponse::NOT_FOUND);
	}
	{
		grpc::ClientContext context;
		reqflow_rpc::AnswerRequest request;
		request.set_correlation_id("ghost");
		request.set_question_id("ghost/R1/low_score");
		request.set_value("accept");
		reqflow_rpc::AnswerResponse response;
		ASSERT_TRUE(stub_->AnswerClarification(&context, request, &response).ok());
		EXPECT_EQ(response.result(), reqflow_rpc::AnswerResponse::NOT_FOUND);
	}
	{
		grpc::ClientContext context;
		reqflow_rpc::GetRunRequest request;
		request.set_correlation_id("ghost");
		reqflow_rpc::RunSnapshot response;
		EXPECT_EQ(stub_->GetRun(&context, request, &response).error_code(), grpc::StatusCode::NOT_FOUND);
	}
	{
		grpc::ClientContext context;
		reqflow_rpc::SubscribeRequest request;
		request.set_correlation_id("ghost");
		auto reader = stub_->Subscribe(&context, request);
		reqflow_rpc::WorkflowEvent event;
		EXPECT_FALSE(reader->Read(&event));
		EXPECT_EQ(reader->Finish().error_code(), grpc::StatusCode::NOT_FOUND);
	}
}
