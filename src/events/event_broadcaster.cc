#include "event_broadcaster.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

namespace Reqflow {

std::optional<WorkflowEvent> EventSubscription::Next(std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	absl::MutexLock lock(&mu_);
	while (pending_.empty() && !closed_ && !cancelled_) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) return std::nullopt;
		cv_.WaitWithTimeout(&mu_, absl::FromChrono(deadline - now));
	}
	if (cancelled_ || pending_.empty()) return std::nullopt;
	WorkflowEvent event = std::move(pending_.front());
	pending_.pop_front();
	return event;
}

bool EventSubscription::Finished() const {
	absl::MutexLock lock(&mu_);
	return cancelled_ || (closed_ && pending_.empty());
}

void EventSubscription::Cancel() {
	absl::MutexLock lock(&mu_);
	cancelled_ = true;
	pending_.clear();
	cv_.SignalAll();
}

void EventSubscription::Push(const WorkflowEvent& event) {
	absl::MutexLock lock(&mu_);
	if (cancelled_) return;
	pending_.push_back(event);
	cv_.Signal();
}

void EventSubscription::Close() {
	absl::MutexLock lock(&mu_);
	closed_ = true;
	cv_.SignalAll();
}

bool EventSubscription::Active() const {
	absl::MutexLock lock(&mu_);
	return !cancelled_;
}

EventBroadcaster::EventBroadcaster(size_t replay_buffer)
	: replay_buffer_(std::max<size_t>(1, replay_buffer)) {}

void EventBroadcaster::OpenChannel(const std::string& correlation_id) {
	absl::MutexLock lock(&mu_);
	auto& channel = channels_[correlation_id];
	if (!channel) {
		channel = std::make_shared<Channel>();
		VLOG(1) << "Opened event channel " << correlation_id;
		return;
	}
	absl::MutexLock channel_lock(&channel->mu);
	// Earlier subscribers were closed with the previous run.
	channel->closed = false;
	channel->replay.clear();
	channel->subscribers.clear();
	VLOG(1) << "Reopened event channel " << correlation_id << " at sequence "
		<< channel->next_sequence;
}

std::shared_ptr<EventBroadcaster::Channel> EventBroadcaster::FindChannel(
		const std::string& correlation_id) const {
	absl::MutexLock lock(&mu_);
	auto it = channels_.find(correlation_id);
	if (it == channels_.end()) return nullptr;
	return it->second;
}

absl::StatusOr<uint64_t> EventBroadcaster::Publish(const std::string& correlation_id,
		EventKind kind, EventPayload payload) {
	auto channel = FindChannel(correlation_id);
	if (!channel) {
		return absl::NotFoundError(absl::StrCat("no event channel for ", correlation_id));
	}
	absl::MutexLock lock(&channel->mu);
	if (channel->closed) {
		return absl::FailedPreconditionError(absl::StrCat("event channel closed: ", correlation_id));
	}
	WorkflowEvent event;
	event.correlation_id = correlation_id;
	event.sequence_number = channel->next_sequence++;
	event.kind = kind;
	event.payload = std::move(payload);
	event.timestamp = std::chrono::system_clock::now();

	channel->replay.push_back(event);
	while (channel->replay.size() > replay_buffer_) channel->replay.pop_front();

	for (const auto& weak : channel->subscribers) {
		if (auto subscriber = weak.lock()) subscriber->Push(event);
	}
	VLOG(3) << correlation_id << " #" << event.sequence_number << " " << EventKindName(kind);
	return event.sequence_number;
}

absl::StatusOr<std::shared_ptr<EventSubscription>> EventBroadcaster::Subscribe(
		const std::string& correlation_id) {
	auto channel = FindChannel(correlation_id);
	if (!channel) {
		return absl::NotFoundError(absl::StrCat("no event channel for ", correlation_id));
	}
	std::shared_ptr<EventSubscription> subscription(new EventSubscription(correlation_id));
	absl::MutexLock lock(&channel->mu);
	for (const auto& event : channel->replay) subscription->Push(event);
	if (channel->closed) {
		subscription->Close();
	} else {
		PruneSubscribers(*channel);
		channel->subscribers.push_back(subscription);
	}
	return subscription;
}

void EventBroadcaster::CloseChannel(const std::string& correlation_id) {
	auto channel = FindChannel(correlation_id);
	if (!channel) return;
	absl::MutexLock lock(&channel->mu);
	if (channel->closed) return;
	channel->closed = true;
	channel->idle_since = Clock::now();
	for (const auto& weak : channel->subscribers) {
		if (auto subscriber = weak.lock()) subscriber->Close();
	}
	VLOG(1) << "Closed event channel " << correlation_id << " after "
		<< channel->next_sequence - 1 << " events";
}

size_t EventBroadcaster::PruneSubscribers(Channel& channel) {
	auto& subs = channel.subscribers;
	subs.erase(std::remove_if(subs.begin(), subs.end(),
				[](const std::weak_ptr<EventSubscription>& weak) {
					auto subscriber = weak.lock();
					return !subscriber || !subscriber->Active();
				}),
			subs.end());
	return subs.size();
}

std::vector<std::string> EventBroadcaster::ReapIdleChannels(std::chrono::milliseconds grace) {
	std::vector<std::string> removed;
	const auto now = Clock::now();
	absl::MutexLock lock(&mu_);
	for (auto it = channels_.begin(); it != channels_.end();) {
		Channel& channel = *it->second;
		bool reap = false;
		{
			absl::MutexLock channel_lock(&channel.mu);
			if (channel.closed) {
				if (PruneSubscribers(channel) > 0) {
					channel.idle_since = now;
				} else if (now - channel.idle_since >= grace) {
					reap = true;
				}
			}
		}
		if (reap) {
			removed.push_back(it->first);
			channels_.erase(it++);
		} else {
			++it;
		}
	}
	if (!removed.empty()) {
		VLOG(1) << "Reaped " << removed.size() << " idle event channels";
	}
	return removed;
}

bool EventBroadcaster::HasChannel(const std::string& correlation_id) const {
	absl::MutexLock lock(&mu_);
	return channels_.contains(correlation_id);
}

size_t EventBroadcaster::ActiveSubscribers(const std::string& correlation_id) const {
	auto channel = FindChannel(correlation_id);
	if (!channel) return 0;
	absl::MutexLock lock(&channel->mu);
	return PruneSubscribers(*channel);
}

} // namespace Reqflow
