#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

#include "common/call_status.h"
#include "pipeline/worker_pool.h"

using namespace Reqflow;
using namespace std::chrono_literals;

class WorkerPoolTest : public ::testing::Test {
protected:
	static TaskQueue<int> MakeQueue(int n) {
		std::vector<WorkItem<int>> items;
		for (int i = 1; i <= n; i++) {
			items.push_back({absl::StrCat("item-", i), i});
		}
		auto queue = TaskQueue<int>::Build(std::move(items));
		EXPECT_TRUE(queue.ok());
		return *std::move(queue);
	}

	static PoolOptions Options(int max_concurrent, int max_attempts,
			std::chrono::milliseconds timeout = 5s) {
		PoolOptions options;
		options.max_concurrent = max_concurrent;
		options.max_attempts = max_attempts;
		options.per_item_timeout = timeout;
		options.retry_backoff = 0ms;
		options.name = "test";
		return options;
	}

	CancellationToken token_;
};

TEST_F(WorkerPoolTest, ConcurrencyNeverExceedsLimit) {
	auto queue = MakeQueue(10);
	WorkerPool<int, int> pool(Options(3, 1));
	std::atomic<int> in_flight{0};
	std::atomic<int> peak{0};

	auto results = pool.Run(queue, [&](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		int now = ++in_flight;
		int prev = peak.load();
		while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
		std::this_thread::sleep_for(50ms);
		--in_flight;
		return item.payload * 2;
	}, token_);

	ASSERT_EQ(results.size(), 10u);
	for (const auto& [id, result] : results) {
		ASSERT_TRUE(result.value.ok()) << id;
		EXPECT_EQ(result.attempts, 1);
	}
	EXPECT_EQ(peak.load(), 3);
	EXPECT_EQ(pool.MaxObservedInFlight(), 3);
}

TEST_F(WorkerPoolTest, FewerItemsThanWorkers) {
	auto queue = MakeQueue(2);
	WorkerPool<int, int> pool(Options(8, 1));
	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		std::this_thread::sleep_for(20ms);
		return item.payload;
	}, token_);
	EXPECT_EQ(results.size(), 2u);
	EXPECT_LE(pool.MaxObservedInFlight(), 2);
}

TEST_F(WorkerPoolTest, EmptyQueueReturnsImmediately) {
	auto queue = MakeQueue(0);
	WorkerPool<int, int> pool(Options(3, 1));
	auto results = pool.Run(queue, [](const WorkItem<int>&, const CancellationToken&)
			-> absl::StatusOr<int> { return 0; }, token_);
	EXPECT_TRUE(results.empty());
}

TEST_F(WorkerPoolTest, TransientFailuresAreRetried) {
	auto queue = MakeQueue(5);
	WorkerPool<int, int> pool(Options(2, 3));
	std::atomic<int> calls_for_third{0};

	auto results = pool.Run(queue, [&](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		if (item.payload == 3 && ++calls_for_third <= 2) {
			return TransientCallError("rate limited");
		}
		return item.payload;
	}, token_);

	ASSERT_EQ(results.size(), 5u);
	EXPECT_TRUE(results.at("item-3").value.ok());
	EXPECT_EQ(results.at("item-3").attempts, 3);
	for (const char* id : {"item-1", "item-2", "item-4", "item-5"}) {
		EXPECT_EQ(results.at(id).attempts, 1) << id;
	}
}

TEST_F(WorkerPoolTest, FatalFailuresAreNotRetried) {
	auto queue = MakeQueue(3);
	WorkerPool<int, int> pool(Options(3, 3));
	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		if (item.payload == 2) return FatalCallError("malformed");
		return item.payload;
	}, token_);

	EXPECT_EQ(results.at("item-2").attempts, 1);
	EXPECT_EQ(results.at("item-2").value.status().code(), absl::StatusCode::kInvalidArgument);
	EXPECT_TRUE(results.at("item-1").value.ok());
}

TEST_F(WorkerPoolTest, RetriesStopAtMaxAttempts) {
	auto queue = MakeQueue(1);
	WorkerPool<int, int> pool(Options(1, 2));
	std::atomic<int> calls{0};
	auto results = pool.Run(queue, [&](const WorkItem<int>&, const CancellationToken&)
			-> absl::StatusOr<int> {
		calls++;
		return TransientCallError("down");
	}, token_);
	EXPECT_EQ(calls.load(), 2);
	EXPECT_EQ(results.at("item-1").attempts, 2);
	EXPECT_FALSE(results.at("item-1").value.ok());
}

TEST_F(WorkerPoolTest, TimeoutAffectsOnlyThatItem) {
	auto queue = MakeQueue(4);
	WorkerPool<int, int> pool(Options(4, 2, 50ms));
	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken& token)
			-> absl::StatusOr<int> {
		if (item.payload == 2) {
			token.WaitFor(10s);
			return token.status();
		}
		return item.payload;
	}, token_);

	ASSERT_EQ(results.size(), 4u);
	const auto& slow = results.at("item-2");
	EXPECT_FALSE(slow.value.ok());
	EXPECT_EQ(slow.value.status().code(), absl::StatusCode::kDeadlineExceeded);
	EXPECT_EQ(slow.attempts, 2);
	for (const char* id : {"item-1", "item-3", "item-4"}) {
		ASSERT_TRUE(results.at(id).value.ok()) << id;
	}
}

TEST_F(WorkerPoolTest, OverrunningHandlerCountsAsTimeout) {
	auto queue = MakeQueue(1);
	WorkerPool<int, int> pool(Options(1, 1, 20ms));
	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		std::this_thread::sleep_for(60ms);
		return item.payload;
	}, token_);
	EXPECT_EQ(results.at("item-1").value.status().code(), absl::StatusCode::kDeadlineExceeded);
}

TEST_F(WorkerPoolTest, HandlerExceptionBecomesItemError) {
	auto queue = MakeQueue(2);
	WorkerPool<int, int> pool(Options(2, 3));
	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> {
		if (item.payload == 1) throw std::runtime_error("boom");
		return item.payload;
	}, token_);
	EXPECT_EQ(results.at("item-1").value.status().code(), absl::StatusCode::kInternal);
	EXPECT_EQ(results.at("item-1").attempts, 1);
	EXPECT_TRUE(results.at("item-2").value.ok());
}

TEST_F(WorkerPoolTest, CancellationEndsPendingItems) {
	auto queue = MakeQueue(6);
	WorkerPool<int, int> pool(Options(1, 1));
	std::atomic<int> started{0};

	auto results = pool.Run(queue, [&](const WorkItem<int>& item, const CancellationToken& token)
			-> absl::StatusOr<int> {
		if (++started == 2) {
			token_.Cancel(CancelledError("stop"));
		}
		if (token.IsCancelled()) return token.status();
		return item.payload;
	}, token_);

	ASSERT_EQ(results.size(), 6u);
	EXPECT_TRUE(results.at("item-1").value.ok());
	EXPECT_LE(started.load(), 2);
	for (const char* id : {"item-2", "item-3", "item-4", "item-5", "item-6"}) {
		EXPECT_TRUE(IsCancellation(results.at(id).value.status())) << id;
	}
}

TEST_F(WorkerPoolTest, NonCancelTokenStatusIsReportedAsCancelled) {
	auto queue = MakeQueue(3);
	WorkerPool<int, int> pool(Options(1, 1));
	token_.Cancel(absl::DeadlineExceededError("run deadline passed"));

	auto results = pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> { return item.payload; }, token_);

	ASSERT_EQ(results.size(), 3u);
	for (const auto& entry : results) {
		const absl::Status& status = entry.second.value.status();
		EXPECT_TRUE(IsCancellation(status)) << entry.first;
		EXPECT_EQ(status.message(), "run deadline passed");
		EXPECT_EQ(entry.second.attempts, 0);
	}
}

TEST_F(WorkerPoolTest, CompletionCallbackSeesEveryItem) {
	auto queue = MakeQueue(7);
	WorkerPool<int, int> pool(Options(3, 1));
	std::mutex mu;
	std::vector<std::string> completed;
	pool.Run(queue, [](const WorkItem<int>& item, const CancellationToken&)
			-> absl::StatusOr<int> { return item.payload; }, token_,
			[&](const std::string& id, const ItemResult<int>& result) {
		EXPECT_TRUE(result.value.ok());
		std::lock_guard<std::mutex> lock(mu);
		completed.push_back(id);
	});
	EXPECT_EQ(completed.size(), 7u);
}
