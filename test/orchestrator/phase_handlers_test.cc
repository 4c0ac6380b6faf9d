#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <thread>

#include "events/event_broadcaster.h"
#include "orchestrator/clarification_gate.h"
#include "orchestrator/phase_handlers.h"
#include "fake_capability.h"

using namespace Reqflow;
using namespace std::chrono_literals;

class PhaseHandlersTest : public ::testing::Test {
protected:
	static RequirementItem Item(const std::string& id, const std::string& text) {
		RequirementItem item;
		item.id = id;
		item.text = text;
		return item;
	}

	FakeCapability capability_;
	CancellationToken token_;
};

TEST_F(PhaseHandlersTest, MiningAssignsIdsAndSource) {
	MiningHandler handler(capability_);
	RequirementItem document = Item("doc", "The system shall log in.\n\nThe system shall log out.");
	auto result = handler.Handle(document, token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Pass);
	ASSERT_EQ(result->artifact.mined_items.size(), 2u);
	EXPECT_EQ(result->artifact.mined_items[0].id, "doc-1");
	EXPECT_EQ(result->artifact.mined_items[1].id, "doc-2");
	EXPECT_EQ(result->artifact.mined_items[1].source_ref, "doc");
}

TEST_F(PhaseHandlersTest, MiningNothingFails) {
	MiningHandler handler(capability_);
	auto result = handler.Handle(Item("doc", "   "), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Fail);
}

TEST_F(PhaseHandlersTest, ValidationUsesRunThreshold) {
	capability_.SetScore("ok-ish", 0.75);
	ValidationHandler lenient(capability_, 0.7);
	ValidationHandler strict(capability_, 0.8);
	EXPECT_EQ(lenient.Handle(Item("R1", "ok-ish"), token_)->verdict, Verdict::Pass);
	auto result = strict.Handle(Item("R1", "ok-ish"), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Fail);
	EXPECT_DOUBLE_EQ(*result->score, 0.75);
	EXPECT_THAT(result->detail, ::testing::HasSubstr("clarity"));
}

TEST_F(PhaseHandlersTest, ValidationPropagatesCapabilityErrors) {
	ValidationHandler handler(capability_, 0.7);
	auto result = handler.Handle(Item("R1", "broken [fatal]"), token_);
	EXPECT_FALSE(result.ok());
}

TEST_F(PhaseHandlersTest, RewriteReEvaluatesRevisedText) {
	capability_.SetScore("slow", 0.3);
	capability_.SetRewrite("slow", "responds within 200 ms");
	RewriteHandler handler(capability_, 0.7);
	auto result = handler.Handle(Item("R1", "slow"), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Pass);
	ASSERT_TRUE(result->artifact.revised_text.has_value());
	EXPECT_EQ(*result->artifact.revised_text, "responds within 200 ms");
}

TEST_F(PhaseHandlersTest, RewriteWithoutSuggestionsKeepsText) {
	capability_.SetScore("vague", 0.3);
	RewriteHandler handler(capability_, 0.7);
	auto result = handler.Handle(Item("R1", "vague"), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Fail);
	EXPECT_FALSE(result->artifact.revised_text.has_value());
}

TEST_F(PhaseHandlersTest, QualityReviewFlagsLowScoreAndDuplicates) {
	capability_.SetScore("users export monthly reports", 0.4);
	std::vector<RequirementItem> corpus = {
		Item("R1", "users export monthly reports"),
		Item("R2", "users export monthly reports"),
		Item("R3", "admins rotate keys"),
	};
	WorkflowConfig config;
	QualityReviewHandler handler(capability_, config, corpus);

	auto flagged = handler.Handle(corpus[0], token_);
	ASSERT_TRUE(flagged.ok());
	EXPECT_EQ(flagged->verdict, Verdict::Fail);
	ASSERT_EQ(flagged->artifact.issues.size(), 2u);
	EXPECT_EQ(flagged->artifact.issues[0].kind, IssueKind::LowScore);
	EXPECT_EQ(flagged->artifact.issues[1].kind, IssueKind::Duplicate);
	EXPECT_EQ(flagged->artifact.issues[1].related_id, "R2");

	auto clean = handler.Handle(corpus[2], token_);
	ASSERT_TRUE(clean.ok());
	EXPECT_EQ(clean->verdict, Verdict::Pass);
	EXPECT_TRUE(clean->artifact.issues.empty());
}

class ClarificationHandlerTest : public PhaseHandlersTest {
protected:
	void SetUp() override {
		events_.OpenChannel("run-1");
		issues_["R4"] = {{IssueKind::LowScore, "score 0.40 below threshold 0.70", ""}};
	}

	EventBroadcaster events_{64};
	ClarificationGate gate_{&events_};
	absl::btree_map<std::string, std::vector<QualityIssue>> issues_;
};

TEST_F(ClarificationHandlerTest, QuestionIdsAreStable) {
	QualityIssue duplicate{IssueKind::Duplicate, "", "R2"};
	EXPECT_EQ(ClarificationHandler::QuestionId("run-1", "R4", issues_["R4"][0]), "run-1/R4/low_score");
	EXPECT_EQ(ClarificationHandler::QuestionId("run-1", "R1", duplicate), "run-1/R1/duplicate/R2");
}

TEST_F(ClarificationHandlerTest, ItemWithoutIssuesPasses) {
	ClarificationHandler handler(gate_, "run-1", issues_, 1s);
	auto result = handler.Handle(Item("R1", "fine"), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Pass);
	EXPECT_EQ(gate_.PendingCount("run-1"), 0u);
}

TEST_F(ClarificationHandlerTest, AnswersDecideTheVerdict) {
	struct Case { const char* answer; Verdict verdict; bool revised; };
	for (const Case& c : {Case{"accept", Verdict::Pass, false}, Case{"reject", Verdict::Fail, false},
			Case{"Users export reports monthly as CSV.", Verdict::Pass, true}}) {
		ClarificationGate gate(&events_);
		ClarificationHandler handler(gate, "run-1", issues_, 10s);
		std::thread answerer([&gate, &c]() {
			while (gate.PendingCount("run-1") == 0) std::this_thread::sleep_for(5ms);
			EXPECT_EQ(gate.Answer("run-1", "run-1/R4/low_score", c.answer), AnswerStatus::kOk);
		});
		auto result = handler.Handle(Item("R4", "vague"), token_);
		answerer.join();
		ASSERT_TRUE(result.ok()) << c.answer;
		EXPECT_EQ(result->verdict, c.verdict) << c.answer;
		EXPECT_EQ(result->artifact.revised_text.has_value(), c.revised) << c.answer;
	}
}

TEST_F(ClarificationHandlerTest, UnansweredQuestionFailsForManualReview) {
	ClarificationHandler handler(gate_, "run-1", issues_, 30ms);
	auto result = handler.Handle(Item("R4", "vague"), token_);
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result->verdict, Verdict::Fail);
	EXPECT_THAT(result->detail, ::testing::HasSubstr("manual review"));
}

TEST_F(ClarificationHandlerTest, CancellationAbortsTheWait) {
	ClarificationHandler handler(gate_, "run-1", issues_, 10s);
	std::thread canceller([this]() {
		std::this_thread::sleep_for(20ms);
		token_.Cancel(CancelledError("stop"));
	});
	auto result = handler.Handle(Item("R4", "vague"), token_);
	canceller.join();
	ASSERT_FALSE(result.ok());
	EXPECT_TRUE(IsCancellation(result.status()));
}

TEST(MakePhaseHandlerTest, OnlyWorkPhasesHaveHandlers) {
	FakeCapability capability;
	ClarificationGate gate(nullptr);
	PhaseContext context;
	context.correlation_id = "run-1";
	context.capability = &capability;
	context.gate = &gate;
	for (Phase phase : {Phase::Mining, Phase::KGBuild, Phase::Validating,
			Phase::Rewriting, Phase::QAReview, Phase::Clarification}) {
		auto handler = MakePhaseHandler(phase, context);
		ASSERT_NE(handler, nullptr) << PhaseName(phase);
		EXPECT_EQ(handler->phase(), phase);
	}
	EXPECT_EQ(MakePhaseHandler(Phase::Completed, context), nullptr);
	EXPECT_EQ(MakePhaseHandler(Phase::Pending, context), nullptr);
}
