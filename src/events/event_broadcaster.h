#ifndef REQFLOW_EVENT_BROADCASTER_H_
#define REQFLOW_EVENT_BROADCASTER_H_

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "common/workflow_types.h"

namespace Reqflow {

/**
 * One observer's view of a channel. Receives the replay buffer at
 * subscription time followed by every later event in sequence order.
 */
class EventSubscription {
	public:
		/**
		 * Next event, or nullopt if none arrived within `timeout` or the
		 * subscription has finished (see Finished()).
		 */
		std::optional<WorkflowEvent> Next(std::chrono::milliseconds timeout);

		// The channel closed and every delivered event was consumed, or Cancel() was called.
		bool Finished() const;

		// Detaches from the channel; it no longer counts as an active subscriber.
		void Cancel();

		const std::string& correlation_id() const { return correlation_id_; }

	private:
		friend class EventBroadcaster;
		explicit EventSubscription(std::string correlation_id)
			: correlation_id_(std::move(correlation_id)) {}

		void Push(const WorkflowEvent& event);
		void Close();
		bool Active() const;

		const std::string correlation_id_;
		mutable absl::Mutex mu_;
		absl::CondVar cv_;
		std::deque<WorkflowEvent> pending_ ABSL_GUARDED_BY(mu_);
		bool closed_ ABSL_GUARDED_BY(mu_) = false;
		bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
};

/**
 * Fan-out of workflow events keyed by correlation id.
 *
 * Each channel has its own lock; sequence numbers are assigned under it, start
 * at 1 and never skip, whatever the number of concurrent publishers.
 */
class EventBroadcaster {
	public:
		explicit EventBroadcaster(size_t replay_buffer = 256);

		/**
		 * Creates the channel, or reopens a closed one. A reopened channel keeps
		 * its sequence counter but starts with an empty replay buffer.
		 */
		void OpenChannel(const std::string& correlation_id);

		/**
		 * @return the sequence number assigned to the event; NotFound for an
		 *         unknown channel, FailedPrecondition once it is closed
		 */
		absl::StatusOr<uint64_t> Publish(const std::string& correlation_id, EventKind kind,
				EventPayload payload);

		/**
		 * Subscribes to an open or closed channel. A subscription to a closed
		 * channel yields the replay buffer and then finishes.
		 */
		absl::StatusOr<std::shared_ptr<EventSubscription>> Subscribe(const std::string& correlation_id);

		// No more events; subscribers finish after draining.
		void CloseChannel(const std::string& correlation_id);

		/**
		 * Removes closed channels that have had no active subscriber for at
		 * least `grace`. Returns the removed correlation ids.
		 */
		std::vector<std::string> ReapIdleChannels(std::chrono::milliseconds grace);

		bool HasChannel(const std::string& correlation_id) const;
		size_t ActiveSubscribers(const std::string& correlation_id) const;

	private:
		using Clock = std::chrono::steady_clock;

		struct Channel {
			absl::Mutex mu;
			uint64_t next_sequence ABSL_GUARDED_BY(mu) = 1;
			std::deque<WorkflowEvent> replay ABSL_GUARDED_BY(mu);
			std::vector<std::weak_ptr<EventSubscription>> subscribers ABSL_GUARDED_BY(mu);
			bool closed ABSL_GUARDED_BY(mu) = false;
			Clock::time_point idle_since ABSL_GUARDED_BY(mu);
		};

		std::shared_ptr<Channel> FindChannel(const std::string& correlation_id) const;
		static size_t PruneSubscribers(Channel& channel) ABSL_EXCLUSIVE_LOCKS_REQUIRED(channel.mu);

		const size_t replay_buffer_;
		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, std::shared_ptr<Channel>> channels_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reqflow

#endif // REQFLOW_EVENT_BROADCASTER_H_
