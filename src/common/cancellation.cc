#include "cancellation.h"

#include <algorithm>

#include "absl/time/time.h"

namespace Reqflow {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

bool CancellationToken::Expired(const State& state, Clock::time_point now) {
	return state.deadline.has_value() && now >= *state.deadline;
}

CancellationToken CancellationToken::WithDeadline(Clock::time_point deadline) const {
	auto child = std::make_shared<State>();
	bool parent_cancelled = false;
	absl::Status parent_reason;
	{
		absl::MutexLock lock(&state_->mu);
		child->deadline = state_->deadline.has_value()
			? std::min(*state_->deadline, deadline)
			: deadline;
		parent_cancelled = state_->cancelled;
		parent_reason = state_->reason;
		if (!parent_cancelled) {
			auto& children = state_->children;
			children.erase(std::remove_if(children.begin(), children.end(),
						[](const std::weak_ptr<State>& w) { return w.expired(); }),
					children.end());
			children.push_back(child);
		}
	}
	if (parent_cancelled) {
		child->cancelled = true;
		child->reason = parent_reason;
	}
	return CancellationToken(std::move(child));
}

void CancellationToken::Cancel(absl::Status reason) const {
	std::vector<std::shared_ptr<State>> to_cancel;
	{
		absl::MutexLock lock(&state_->mu);
		if (state_->cancelled) return;
		state_->cancelled = true;
		state_->reason = reason.ok() ? absl::CancelledError("cancelled") : reason;
		for (auto& weak : state_->children) {
			if (auto child = weak.lock()) to_cancel.push_back(std::move(child));
		}
		state_->children.clear();
		state_->cv.SignalAll();
	}
	for (auto& child : to_cancel) {
		CancellationToken(child).Cancel(reason);
	}
}

bool CancellationToken::IsCancelled() const {
	absl::MutexLock lock(&state_->mu);
	return state_->cancelled || Expired(*state_, Clock::now());
}

bool CancellationToken::IsExpired() const {
	absl::MutexLock lock(&state_->mu);
	return Expired(*state_, Clock::now());
}

absl::Status CancellationToken::status() const {
	absl::MutexLock lock(&state_->mu);
	if (state_->cancelled) return state_->reason;
	if (Expired(*state_, Clock::now())) {
		return absl::DeadlineExceededError("deadline exceeded");
	}
	return absl::OkStatus();
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
	absl::MutexLock lock(&state_->mu);
	return state_->deadline;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
	const auto wait_end = Clock::now() + timeout;
	absl::MutexLock lock(&state_->mu);
	while (true) {
		auto now = Clock::now();
		if (state_->cancelled || Expired(*state_, now)) return true;
		if (now >= wait_end) return false;
		auto until = wait_end;
		if (state_->deadline.has_value()) until = std::min(until, *state_->deadline);
		state_->cv.WaitWithTimeout(&state_->mu, absl::FromChrono(until - now));
	}
}

} // namespace Reqflow
