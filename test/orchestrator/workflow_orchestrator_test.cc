#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "orchestrator/session_registry.h"
#include "orchestrator/workflow_orchestrator.h"
#include "fake_capability.h"

using namespace Reqflow;
using namespace std::chrono_literals;

class WorkflowOrchestratorTest : public ::testing::Test {
protected:
	void SetUp() override {
		OrchestratorOptions options;
		options.reap_interval = 10ms;
		options.channel_grace = 60s;
		orchestrator_ = std::make_unique<WorkflowOrchestrator>(capability_, options);
		config_.per_item_timeout = 5s;
		config_.retry_backoff = 0ms;
		config_.clarification_timeout = 10s;
	}

	void TearDown() override {
		orchestrator_->Shutdown();
	}

	static RequirementItem Item(const std::string& id, const std::string& text) {
		RequirementItem item;
		item.id = id;
		item.text = text;
		item.source_ref = "test";
		return item;
	}

	static WorkflowRequest FourItems() {
		WorkflowRequest request;
		request.items = {
			Item("R1", "The system shall encrypt stored data"),
			Item("R2", "Operators must rotate signing keys monthly"),
			Item("R3", "Auditors can export access logs as CSV"),
			Item("R4", "It should be fast"),
		};
		return request;
	}

	// Events of a finished run, in sequence order.
	std::vector<WorkflowEvent> AllEvents(const std::string& correlation_id) {
		std::vector<WorkflowEvent> events;
		auto subscription = orchestrator_->Subscribe(correlation_id);
		EXPECT_TRUE(subscription.ok());
		if (!subscription.ok()) return events;
		while (auto event = (*subscription)->Next(1s)) events.push_back(*event);
		return events;
	}

	// Blocks until a question event shows up on a live subscription.
	static std::optional<WorkflowEvent> NextQuestion(EventSubscription& subscription) {
		while (auto event = subscription.Next(10s)) {
			if (event->kind == EventKind::Question) return event;
		}
		return std::nullopt;
	}

	FakeCapability capability_;
	WorkflowConfig config_;
	std::unique_ptr<WorkflowOrchestrator> orchestrator_;
};

TEST_F(WorkflowOrchestratorTest, CleanBatchCompletes) {
	WorkflowRequest request = FourItems();
	request.items.pop_back();
	ASSERT_EQ(orchestrator_->Submit("run-ok", request, config_), SubmitStatus::kAccepted);

	auto run = orchestrator_->WaitForResult("run-ok", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	EXPECT_EQ(run->failure_reason, FailureReason::None);
	ASSERT_EQ(run->items.size(), 3u);
	for (const auto& item : run->items) {
		EXPECT_EQ(item.verdict, Verdict::Pass) << item.id;
		EXPECT_DOUBLE_EQ(*item.current_score, 0.9);
	}
	// Mining (no documents), KGBuild, Validating, QAReview
	ASSERT_EQ(run->phase_results.size(), 4u);
	EXPECT_EQ(run->phase_results[2].phase, Phase::Validating);
	EXPECT_EQ(run->graph.nodes.size(), 4u);
	EXPECT_TRUE(run->ended_at.has_value());

	auto events = AllEvents("run-ok");
	ASSERT_FALSE(events.empty());
	for (size_t i = 0; i < events.size(); i++) {
		EXPECT_EQ(events[i].sequence_number, i + 1);
	}
	EXPECT_EQ(events.back().kind, EventKind::WorkflowResult);
	EXPECT_EQ(events.back().payload.at("status"), "completed");

	std::vector<std::string> phases;
	for (const auto& event : events) {
		if (event.kind == EventKind::WorkflowStatus) phases.push_back(event.payload.at("phase"));
	}
	EXPECT_THAT(phases, ::testing::ElementsAre("Pending", "Mining", "KGBuild", "Validating",
				"QAReview", "Completed"));
}

TEST_F(WorkflowOrchestratorTest, MinesDocumentsIntoRequirements) {
	WorkflowRequest request;
	request.documents = {{"manual", "The system shall log in\nThe system shall log out", "manual.md"}};
	request.items = {Item("manual-1", "Operators must rotate keys")};
	ASSERT_EQ(orchestrator_->Submit("run-mine", request, config_), SubmitStatus::kAccepted);

	auto run = orchestrator_->WaitForResult("run-mine", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	std::vector<std::string> ids;
	for (const auto& item : run->items) ids.push_back(item.id);
	// The mined id clashing with a submitted one is suffixed
	EXPECT_THAT(ids, ::testing::ElementsAre("manual-1", "manual-1~2", "manual-2"));
	EXPECT_EQ(run->items[1].history.front().phase, Phase::Mining);
	EXPECT_EQ(run->items[1].source_ref, "manual.md");
}

TEST_F(WorkflowOrchestratorTest, LowScoreItemWaitsForClarification) {
	capability_.SetScore("It should be fast", 0.4);
	ASSERT_EQ(orchestrator_->Submit("run-d", FourItems(), config_), SubmitStatus::kAccepted);
	auto subscription = orchestrator_->Subscribe("run-d");
	ASSERT_TRUE(subscription.ok());

	auto question = NextQuestion(**subscription);
	ASSERT_TRUE(question.has_value());
	EXPECT_EQ(question->payload.at("item_id"), "R4");
	const std::string question_id = question->payload.at("question_id");
	auto snapshot = orchestrator_->Snapshot("run-d");
	ASSERT_TRUE(snapshot.has_value());
	EXPECT_EQ(snapshot->phase, Phase::Clarification);

	EXPECT_EQ(orchestrator_->AnswerClarification("run-d", question_id, "accept"), AnswerStatus::kOk);
	auto run = orchestrator_->WaitForResult("run-d", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	EXPECT_EQ(run->items[3].verdict, Verdict::Pass);
	ASSERT_EQ(run->questions.size(), 1u);
	EXPECT_EQ(run->questions[0].question_id, question_id);

	EXPECT_EQ(orchestrator_->AnswerClarification("run-d", question_id, "reject"),
			AnswerStatus::kAlreadyAnswered);
}

TEST_F(WorkflowOrchestratorTest, RevisedAnswerReplacesText) {
	capability_.SetScore("It should be fast", 0.4);
	ASSERT_EQ(orchestrator_->Submit("run-rev", FourItems(), config_), SubmitStatus::kAccepted);
	auto subscription = orchestrator_->Subscribe("run-rev");
	ASSERT_TRUE(subscription.ok());
	auto question = NextQuestion(**subscription);
	ASSERT_TRUE(question.has_value());

	const std::string revised = "Pages load within 200 ms for 95 percent of requests";
	EXPECT_EQ(orchestrator_->AnswerClarification("run-rev", question->payload.at("question_id"), revised),
			AnswerStatus::kOk);
	auto run = orchestrator_->WaitForResult("run-rev", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->items[3].text, revised);
}

TEST_F(WorkflowOrchestratorTest, UnansweredQuestionTimesOut) {
	capability_.SetScore("It should be fast", 0.4);
	config_.clarification_timeout = 50ms;
	ASSERT_EQ(orchestrator_->Submit("run-timeout", FourItems(), config_), SubmitStatus::kAccepted);
	auto run = orchestrator_->WaitForResult("run-timeout", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	EXPECT_EQ(run->items[3].verdict, Verdict::Fail);
}

TEST_F(WorkflowOrchestratorTest, FailedItemsAreRewritten) {
	capability_.SetScore("It should be fast", 0.4);
	capability_.SetRewrite("It should be fast", "Pages load within 200 ms");
	ASSERT_EQ(orchestrator_->Submit("run-rw", FourItems(), config_), SubmitStatus::kAccepted);
	auto run = orchestrator_->WaitForResult("run-rw", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	EXPECT_EQ(run->items[3].text, "Pages load within 200 ms");
	EXPECT_EQ(run->items[3].verdict, Verdict::Pass);
	std::vector<Phase> phases;
	for (const auto& result : run->phase_results) phases.push_back(result.phase);
	EXPECT_THAT(phases, ::testing::Contains(Phase::Rewriting));
	EXPECT_TRUE(run->questions.empty());
}

TEST_F(WorkflowOrchestratorTest, DuplicateActiveSubmissionIsRejected) {
	WorkflowRequest request = FourItems();
	request.items[0].text = "Blocked requirement [block]";
	ASSERT_EQ(orchestrator_->Submit("run-e", request, config_), SubmitStatus::kAccepted);

	std::string detail;
	EXPECT_EQ(orchestrator_->Submit("run-e", FourItems(), config_, &detail),
			SubmitStatus::kRejectedDuplicate);
	EXPECT_THAT(detail, ::testing::HasSubstr("run-e"));

	EXPECT_EQ(orchestrator_->Cancel("run-e"), CancelStatus::kOk);
	ASSERT_TRUE(orchestrator_->WaitForResult("run-e", 10s).has_value());
	// Finished runs may be submitted again
	EXPECT_EQ(orchestrator_->Submit("run-e", FourItems(), config_), SubmitStatus::kAccepted);
	auto rerun = orchestrator_->WaitForResult("run-e", 10s);
	ASSERT_TRUE(rerun.has_value());
	EXPECT_EQ(rerun->phase, Phase::Completed);
}

TEST_F(WorkflowOrchestratorTest, ResubmittedRunStreamsOnlyItsOwnEvents) {
	ASSERT_EQ(orchestrator_->Submit("run-r", FourItems(), config_), SubmitStatus::kAccepted);
	ASSERT_TRUE(orchestrator_->WaitForResult("run-r", 10s).has_value());
	const uint64_t last_sequence = AllEvents("run-r").back().sequence_number;

	ASSERT_EQ(orchestrator_->Submit("run-r", FourItems(), config_), SubmitStatus::kAccepted);
	ASSERT_TRUE(orchestrator_->WaitForResult("run-r", 10s).has_value());

	auto events = AllEvents("run-r");
	ASSERT_FALSE(events.empty());
	EXPECT_EQ(events.front().kind, EventKind::WorkflowStatus);
	EXPECT_EQ(events.front().payload.at("phase"), "Pending");
	EXPECT_EQ(events.front().payload.at("status"), "accepted");
	EXPECT_EQ(events.front().sequence_number, last_sequence + 1);
	size_t results = 0;
	for (const auto& event : events) {
		if (event.kind == EventKind::WorkflowResult) results++;
	}
	EXPECT_EQ(results, 1u);
	EXPECT_EQ(events.back().kind, EventKind::WorkflowResult);
}

TEST_F(WorkflowOrchestratorTest, CancelStopsWithoutFurtherTransitions) {
	WorkflowRequest request = FourItems();
	request.items[1].text = "Blocked requirement [block]";
	ASSERT_EQ(orchestrator_->Submit("run-c", request, config_), SubmitStatus::kAccepted);

	// Wait until validation is under way
	for (int i = 0; i < 500 && capability_.evaluate_calls() == 0; i++) {
		std::this_thread::sleep_for(5ms);
	}
	EXPECT_EQ(orchestrator_->Cancel("run-c"), CancelStatus::kOk);
	auto snapshot = orchestrator_->Snapshot("run-c");
	ASSERT_TRUE(snapshot.has_value());
	EXPECT_EQ(snapshot->phase, Phase::Failed);
	EXPECT_EQ(snapshot->failure_reason, FailureReason::Cancelled);

	auto run = orchestrator_->WaitForResult("run-c", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Failed);
	EXPECT_EQ(orchestrator_->Cancel("run-c"), CancelStatus::kNotFound);

	auto events = AllEvents("run-c");
	bool failed_seen = false;
	for (const auto& event : events) {
		if (event.kind != EventKind::WorkflowStatus) continue;
		EXPECT_FALSE(failed_seen) << "transition after Failed: " << event.payload.at("phase");
		if (event.payload.at("phase") == "Failed") {
			failed_seen = true;
			EXPECT_EQ(event.payload.at("reason"), "Cancelled");
		}
	}
	EXPECT_TRUE(failed_seen);
	ASSERT_FALSE(events.empty());
	EXPECT_EQ(events.back().kind, EventKind::WorkflowResult);
	EXPECT_EQ(events.back().payload.at("status"), "failed");
}

TEST_F(WorkflowOrchestratorTest, CancelWhileWaitingForAnswer) {
	capability_.SetScore("It should be fast", 0.4);
	ASSERT_EQ(orchestrator_->Submit("run-cq", FourItems(), config_), SubmitStatus::kAccepted);
	auto subscription = orchestrator_->Subscribe("run-cq");
	ASSERT_TRUE(subscription.ok());
	auto question = NextQuestion(**subscription);
	ASSERT_TRUE(question.has_value());

	EXPECT_EQ(orchestrator_->Cancel("run-cq"), CancelStatus::kOk);
	auto run = orchestrator_->WaitForResult("run-cq", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->failure_reason, FailureReason::Cancelled);
	EXPECT_EQ(orchestrator_->AnswerClarification("run-cq", question->payload.at("question_id"), "accept"),
			AnswerStatus::kAlreadyAnswered);
}

TEST_F(WorkflowOrchestratorTest, NothingMinedFails) {
	WorkflowRequest request;
	request.documents = {{"empty", "\n\n", "empty.md"}};
	ASSERT_EQ(orchestrator_->Submit("run-none", request, config_), SubmitStatus::kAccepted);
	auto run = orchestrator_->WaitForResult("run-none", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Failed);
	EXPECT_EQ(run->failure_reason, FailureReason::NoRequirements);
}

TEST_F(WorkflowOrchestratorTest, AllItemsErroredExhaustsRun) {
	WorkflowRequest request;
	request.items = {Item("R1", "bad [fatal]"), Item("R2", "worse [fatal]")};
	ASSERT_EQ(orchestrator_->Submit("run-x", request, config_), SubmitStatus::kAccepted);
	auto run = orchestrator_->WaitForResult("run-x", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Failed);
	EXPECT_EQ(run->failure_reason, FailureReason::PhaseExhausted);
	EXPECT_THAT(run->failure_detail, ::testing::HasSubstr("Validating"));
}

TEST_F(WorkflowOrchestratorTest, OneErroredItemDoesNotStopTheRun) {
	WorkflowRequest request = FourItems();
	request.items[2].text = "bad [fatal]";
	ASSERT_EQ(orchestrator_->Submit("run-partial", request, config_), SubmitStatus::kAccepted);
	auto run = orchestrator_->WaitForResult("run-partial", 10s);
	ASSERT_TRUE(run.has_value());
	EXPECT_EQ(run->phase, Phase::Completed);
	EXPECT_EQ(run->items[2].verdict, Verdict::Error);
}

TEST_F(WorkflowOrchestratorTest, InvalidSubmissionsAreRejected) {
	std::string detail;
	EXPECT_EQ(orchestrator_->Submit("", FourItems(), config_, &detail), SubmitStatus::kRejectedInvalid);
	EXPECT_EQ(orchestrator_->Submit("run-empty", WorkflowRequest(), config_, &detail),
			SubmitStatus::kRejectedInvalid);

	WorkflowRequest duplicate = FourItems();
	duplicate.items[1].id = "R1";
	EXPECT_EQ(orchestrator_->Submit("run-dup-ids", duplicate, config_, &detail),
			SubmitStatus::kRejectedInvalid);
	EXPECT_THAT(detail, ::testing::HasSubstr("R1"));

	WorkflowConfig bad = config_;
	bad.max_attempts = 0;
	EXPECT_EQ(orchestrator_->Submit("run-bad-config", FourItems(), bad, &detail),
			SubmitStatus::kRejectedInvalid);
	EXPECT_EQ(orchestrator_->SessionCount(), 0u);
}

TEST_F(WorkflowOrchestratorTest, UnknownRunLookups) {
	EXPECT_EQ(orchestrator_->Cancel("ghost"), CancelStatus::kNotFound);
	EXPECT_EQ(orchestrator_->AnswerClarification("ghost", "ghost/R1/low_score", "accept"),
			AnswerStatus::kNotFound);
	EXPECT_FALSE(orchestrator_->Subscribe("ghost").ok());
	EXPECT_FALSE(orchestrator_->Snapshot("ghost").has_value());
	EXPECT_FALSE(orchestrator_->WaitForResult("ghost", 10ms).has_value());
}

TEST_F(WorkflowOrchestratorTest, ShutdownCancelsActiveRuns) {
	WorkflowRequest request = FourItems();
	request.items[0].text = "Blocked requirement [block]";
	ASSERT_EQ(orchestrator_->Submit("run-s", request, config_), SubmitStatus::kAccepted);
	orchestrator_->Shutdown();
	EXPECT_EQ(orchestrator_->SessionCount(), 0u);
	EXPECT_EQ(orchestrator_->Submit("run-after", FourItems(), config_), SubmitStatus::kRejectedInvalid);
}

TEST(WorkflowOrchestratorReapTest, FinishedRunsAreDroppedAfterGrace) {
	FakeCapability capability;
	OrchestratorOptions options;
	options.reap_interval = 10ms;
	options.channel_grace = 20ms;
	WorkflowOrchestrator orchestrator(capability, options);

	WorkflowRequest request;
	RequirementItem item;
	item.id = "R1";
	item.text = "Operators must rotate keys";
	request.items.push_back(item);
	ASSERT_EQ(orchestrator.Submit("run-r", request, WorkflowConfig()), SubmitStatus::kAccepted);
	ASSERT_TRUE(orchestrator.WaitForResult("run-r", 10s).has_value());

	for (int i = 0; i < 500 && orchestrator.SessionCount() > 0; i++) {
		std::this_thread::sleep_for(5ms);
	}
	EXPECT_EQ(orchestrator.SessionCount(), 0u);
	EXPECT_FALSE(orchestrator.events().HasChannel("run-r"));
	orchestrator.Shutdown();
}

TEST(WorkflowOrchestratorReapTest, ShutdownDoesNotWaitForReapInterval) {
	FakeCapability capability;
	OrchestratorOptions options;
	options.reap_interval = 60s;
	WorkflowOrchestrator orchestrator(capability, options);

	const auto start = std::chrono::steady_clock::now();
	orchestrator.Shutdown();
	EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(SessionRegistryTest, ActiveIdsCannotBeReused) {
	SessionRegistry registry;
	std::shared_ptr<Session> replaced;
	auto first = registry.Create("run-1", WorkflowConfig(), &replaced);
	ASSERT_TRUE(first.ok());
	EXPECT_EQ(registry.Create("run-1", WorkflowConfig(), &replaced).status().code(),
			absl::StatusCode::kAlreadyExists);
	EXPECT_EQ(registry.EraseFinished("run-1"), nullptr);

	{
		absl::MutexLock lock(&(*first)->mu);
		(*first)->finished = true;
	}
	auto second = registry.Create("run-1", WorkflowConfig(), &replaced);
	ASSERT_TRUE(second.ok());
	EXPECT_EQ(replaced, *first);
	EXPECT_EQ(registry.size(), 1u);
}
