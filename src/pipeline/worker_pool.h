#ifndef REQFLOW_WORKER_POOL_H_
#define REQFLOW_WORKER_POOL_H_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <glog/logging.h>
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "folly/MPMCQueue.h"

#include "common/call_status.h"
#include "common/cancellation.h"
#include "task_queue.h"

namespace Reqflow {

struct PoolOptions {
	int max_concurrent = 1;
	std::chrono::milliseconds per_item_timeout{120000};
	int max_attempts = 1;
	// Doubled after every failed attempt
	std::chrono::milliseconds retry_backoff{0};
	std::string name = "pool";
};

template <typename R>
struct ItemResult {
	absl::StatusOr<R> value = absl::UnknownError("item not run");
	int attempts = 0;
	std::chrono::milliseconds elapsed{0};
};

/**
 * Bounded pool that runs one phase handler over a TaskQueue.
 *
 * Exactly min(max_concurrent, n) threads pull item indices FIFO from a
 * dispatch queue, so at most max_concurrent handler calls are in flight.
 * Every attempt runs under a child of the pool token that expires after
 * per_item_timeout. Retryable failures are retried up to max_attempts;
 * anything else ends that item only.
 */
template <typename T, typename R>
class WorkerPool {
	public:
		using Handler = std::function<absl::StatusOr<R>(const WorkItem<T>&, const CancellationToken&)>;
		using CompletionCallback = std::function<void(const std::string&, const ItemResult<R>&)>;
		using Results = absl::flat_hash_map<std::string, ItemResult<R>>;

		explicit WorkerPool(PoolOptions options) : options_(std::move(options)) {
			options_.max_concurrent = std::max(1, options_.max_concurrent);
			options_.max_attempts = std::max(1, options_.max_attempts);
		}

		/**
		 * Blocks until every item has a result. Items not started when `token`
		 * is cancelled end with a Cancelled status. `on_complete` is invoked
		 * from the worker thread that finished the item.
		 */
		Results Run(const TaskQueue<T>& queue, const Handler& handler,
				const CancellationToken& token,
				const CompletionCallback& on_complete = nullptr) {
			Results results;
			const size_t n = queue.size();
			if (n == 0) return results;

			const size_t num_workers = std::min(static_cast<size_t>(options_.max_concurrent), n);
			std::vector<ItemResult<R>> slots(n);

			// Room for every index plus one sentinel per worker; writes never block.
			folly::MPMCQueue<std::optional<size_t>> dispatch(n + num_workers);
			for (size_t i = 0; i < n; i++) {
				dispatch.blockingWrite(std::optional<size_t>(i));
			}
			for (size_t i = 0; i < num_workers; i++) {
				dispatch.blockingWrite(std::optional<size_t>());
			}

			VLOG(1) << "[" << options_.name << "] dispatching " << n << " items to "
				<< num_workers << " workers";

			std::vector<std::thread> workers;
			workers.reserve(num_workers);
			for (size_t w = 0; w < num_workers; w++) {
				workers.emplace_back([&]() {
					while (true) {
						std::optional<size_t> index;
						dispatch.blockingRead(index);
						if (!index.has_value()) break;
						const WorkItem<T>& item = queue.at(*index);
						slots[*index] = RunItem(item, handler, token);
						if (on_complete) on_complete(item.id, slots[*index]);
					}
				});
			}
			for (std::thread& worker : workers) {
				if (worker.joinable()) worker.join();
			}

			results.reserve(n);
			for (size_t i = 0; i < n; i++) {
				results.emplace(queue.at(i).id, std::move(slots[i]));
			}
			return results;
		}

		int MaxObservedInFlight() const { return max_in_flight_.load(); }
		const PoolOptions& options() const { return options_; }

	private:
		static absl::Status CancelStatus(const CancellationToken& token) {
			absl::Status status = token.status();
			if (IsCancellation(status)) return status;
			return Reqflow::CancelledError(status.message());
		}

		void EnterFlight() {
			int now = in_flight_.fetch_add(1) + 1;
			int prev = max_in_flight_.load();
			while (prev < now && !max_in_flight_.compare_exchange_weak(prev, now)) {}
		}

		ItemResult<R> RunItem(const WorkItem<T>& item, const Handler& handler,
				const CancellationToken& token) {
			const auto start = CancellationToken::Clock::now();
			ItemResult<R> result;

			for (int attempt = 1; attempt <= options_.max_attempts; attempt++) {
				if (token.IsCancelled()) {
					result.value = CancelStatus(token);
					break;
				}
				result.attempts = attempt;
				CancellationToken attempt_token = token.WithTimeout(options_.per_item_timeout);

				EnterFlight();
				absl::StatusOr<R> value;
				try {
					value = handler(item, attempt_token);
				} catch (const std::exception& e) {
					value = absl::InternalError(absl::StrCat("handler threw: ", e.what()));
				}
				in_flight_.fetch_sub(1);

				if (token.IsCancelled()) {
					result.value = CancelStatus(token);
					break;
				}
				// An attempt that overran its deadline counts as a timeout even if
				// the handler produced a value.
				if (attempt_token.IsExpired() && (value.ok() || IsCancellation(value.status()))) {
					value = absl::DeadlineExceededError(absl::StrCat(
								"item ", item.id, " exceeded ", options_.per_item_timeout.count(), "ms"));
				}
				result.value = std::move(value);
				if (result.value.ok() || !IsRetryable(result.value.status())) break;

				VLOG(2) << "[" << options_.name << "] item " << item.id << " attempt " << attempt
					<< "/" << options_.max_attempts << " failed: " << result.value.status();
				if (attempt < options_.max_attempts && options_.retry_backoff.count() > 0) {
					auto backoff = options_.retry_backoff * (1 << std::min(attempt - 1, 16));
					if (token.WaitFor(backoff)) {
						result.value = CancelStatus(token);
						break;
					}
				}
			}

			result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
					CancellationToken::Clock::now() - start);
			return result;
		}

		PoolOptions options_;
		std::atomic<int> in_flight_{0};
		std::atomic<int> max_in_flight_{0};
};

} // namespace Reqflow

#endif // REQFLOW_WORKER_POOL_H_
