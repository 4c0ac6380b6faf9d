#ifndef REQFLOW_CANCELLATION_H_
#define REQFLOW_CANCELLATION_H_

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

namespace Reqflow {

/**
 * Cooperative cancellation signal passed through every handler call.
 *
 * A token is cancelled explicitly (Cancel) or implicitly once its deadline
 * passes. Children inherit the earlier of their own and their parent's
 * deadline and are cancelled together with the parent, which is how a
 * per-item timeout composes with run-level cancellation. Copies share state.
 */
class CancellationToken {
public:
	using Clock = std::chrono::steady_clock;

	CancellationToken();

	/**
	 * Creates a child that expires at `deadline` at the latest.
	 */
	CancellationToken WithDeadline(Clock::time_point deadline) const;
	CancellationToken WithTimeout(std::chrono::milliseconds timeout) const {
		return WithDeadline(Clock::now() + timeout);
	}

	/**
	 * Cancels this token and every child. The first reason sticks.
	 */
	void Cancel(absl::Status reason = absl::CancelledError("cancelled")) const;

	bool IsCancelled() const;
	bool IsExpired() const;

	/**
	 * OK while live, the cancel reason once cancelled, DeadlineExceeded
	 * once the deadline has passed.
	 */
	absl::Status status() const;

	std::optional<Clock::time_point> deadline() const;

	/**
	 * Blocks up to `timeout`. Returns true if the token was cancelled or
	 * expired before the wait ended.
	 */
	bool WaitFor(std::chrono::milliseconds timeout) const;

private:
	struct State {
		absl::Mutex mu;
		absl::CondVar cv;
		bool cancelled = false;
		absl::Status reason;
		std::optional<Clock::time_point> deadline;
		std::vector<std::weak_ptr<State>> children;
	};

	explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

	static bool Expired(const State& state, Clock::time_point now);

	std::shared_ptr<State> state_;
};

} // namespace Reqflow

#endif // REQFLOW_CANCELLATION_H_
