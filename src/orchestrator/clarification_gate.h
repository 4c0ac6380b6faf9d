#ifndef REQFLOW_CLARIFICATION_GATE_H_
#define REQFLOW_CLARIFICATION_GATE_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "common/workflow_types.h"

namespace Reqflow {

class EventBroadcaster;

enum class AnswerStatus { kOk, kAlreadyAnswered, kNotFound };

const char* AnswerStatusName(AnswerStatus status);

/**
 * Human-in-the-loop questions. Every question resolves exactly once: by the
 * first Answer(), by its timeout (value "fail", flagged timed_out) or by
 * cancellation of its run. Await() blocks only the calling worker.
 */
class ClarificationGate {
	public:
		static constexpr char kTimeoutValue[] = "fail";

		/**
		 * @param events may be null; questions are then only logged
		 */
		explicit ClarificationGate(EventBroadcaster* events);

		/**
		 * Registers the question and publishes a question event.
		 * AlreadyExists if the id is in use.
		 */
		absl::Status Open(const ClarificationQuestion& question);

		/**
		 * Waits for the resolution of `question_id`. Returns a cancelled answer
		 * when `token` fires first, a timed-out answer after `timeout`.
		 */
		ClarificationAnswer Await(const std::string& question_id, std::chrono::milliseconds timeout,
				const CancellationToken& token);

		AnswerStatus Answer(const std::string& correlation_id, const std::string& question_id,
				const std::string& value);

		// Resolves every pending question of the run as cancelled.
		void CancelAll(const std::string& correlation_id);

		// Drops every record of the run.
		void Forget(const std::string& correlation_id);

		size_t PendingCount(const std::string& correlation_id) const;
		std::optional<ClarificationAnswer> Resolution(const std::string& question_id) const;

	private:
		struct Record {
			ClarificationQuestion question;
			std::optional<ClarificationAnswer> answer;
		};

		// Sets the answer unless already resolved.
		bool Resolve(Record& record, ClarificationAnswer answer) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

		EventBroadcaster* events_;
		mutable absl::Mutex mu_;
		absl::CondVar resolved_cv_;
		absl::flat_hash_map<std::string, std::unique_ptr<Record>> records_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reqflow

#endif // REQFLOW_CLARIFICATION_GATE_H_
