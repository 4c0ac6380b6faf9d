#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "pipeline/task_queue.h"

using namespace Reqflow;

TEST(TaskQueueTest, KeepsInsertionOrder) {
	auto queue = TaskQueue<int>::Build({{"c", 3}, {"a", 1}, {"b", 2}});
	ASSERT_TRUE(queue.ok()) << queue.status();
	EXPECT_EQ(queue->size(), 3u);
	EXPECT_THAT(queue->Ids(), ::testing::ElementsAre("c", "a", "b"));
	EXPECT_EQ(queue->at(1).payload, 1);
}

TEST(TaskQueueTest, EmptyQueueIsAllowed) {
	auto queue = TaskQueue<int>::Build({});
	ASSERT_TRUE(queue.ok());
	EXPECT_TRUE(queue->empty());
}

TEST(TaskQueueTest, RejectsDuplicateIds) {
	auto queue = TaskQueue<int>::Build({{"a", 1}, {"b", 2}, {"a", 3}});
	ASSERT_FALSE(queue.ok());
	EXPECT_EQ(queue.status().code(), absl::StatusCode::kInvalidArgument);
	EXPECT_THAT(std::string(queue.status().message()), ::testing::HasSubstr("a"));
}

TEST(TaskQueueTest, RejectsEmptyId) {
	auto queue = TaskQueue<std::string>::Build({{"", "x"}});
	EXPECT_FALSE(queue.ok());
}
