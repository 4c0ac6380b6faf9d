#ifndef REQFLOW_WORKFLOW_ORCHESTRATOR_H_
#define REQFLOW_WORKFLOW_ORCHESTRATOR_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "capabilities/capability.h"
#include "common/workflow_config.h"
#include "common/workflow_types.h"
#include "events/event_broadcaster.h"
#include "pipeline/worker_pool.h"
#include "clarification_gate.h"
#include "phase_handlers.h"
#include "session_registry.h"
#include "state_machine.h"

namespace Reqflow {

enum class SubmitStatus { kAccepted, kRejectedDuplicate, kRejectedInvalid };
enum class CancelStatus { kOk, kNotFound };

const char* SubmitStatusName(SubmitStatus status);
const char* CancelStatusName(CancelStatus status);

// A submitted batch: documents to mine and/or requirements to take as is.
struct WorkflowRequest {
	std::vector<SourceDocument> documents;
	std::vector<RequirementItem> items;
};

struct OrchestratorOptions {
	size_t replay_buffer = 256;
	// How long a finished run stays queryable without subscribers
	std::chrono::milliseconds channel_grace{30000};
	std::chrono::milliseconds reap_interval{1000};
	// Added to clarification_timeout for the clarification worker deadline
	std::chrono::milliseconds clarification_slack{5000};
};

/**
 * Drives workflow runs through the phase state machine.
 *
 * Every accepted submission gets a session and a driver thread that runs one
 * Delegator per phase. Progress, transitions, questions and the final result
 * are published on the run's event channel. Finished sessions are dropped
 * by a reaper thread once their channel had no subscriber for channel_grace.
 */
class WorkflowOrchestrator {
	public:
		WorkflowOrchestrator(RequirementsCapability& capability,
				OrchestratorOptions options = OrchestratorOptions());
		~WorkflowOrchestrator();

		/**
		 * Starts a run. kRejectedDuplicate while a run with the same id is
		 * active, kRejectedInvalid for unusable input (reason in `detail`).
		 */
		SubmitStatus Submit(const std::string& correlation_id, WorkflowRequest request,
				WorkflowConfig config, std::string* detail = nullptr);

		/**
		 * Moves an active run to Failed(Cancelled) right away and stops its
		 * workers cooperatively. kNotFound for unknown or terminal runs.
		 */
		CancelStatus Cancel(const std::string& correlation_id);

		AnswerStatus AnswerClarification(const std::string& correlation_id,
				const std::string& question_id, const std::string& value);

		absl::StatusOr<std::shared_ptr<EventSubscription>> Subscribe(const std::string& correlation_id);

		/**
		 * Blocks until the run published its result. nullopt if the id is
		 * unknown or the run is still going after `timeout`.
		 */
		std::optional<WorkflowRun> WaitForResult(const std::string& correlation_id,
				std::chrono::milliseconds timeout);

		std::optional<WorkflowRun> Snapshot(const std::string& correlation_id) const;

		// Cancels every active run and joins all threads. Idempotent.
		void Shutdown();

		size_t SessionCount() const { return sessions_.size(); }
		EventBroadcaster& events() { return events_; }
		ClarificationGate& gate() { return gate_; }

	private:
		void Drive(std::shared_ptr<Session> session);
		void ReapLoop();

		std::vector<RequirementItem> UnitsFor(Session& session, Phase phase)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);
		PhaseContext ContextFor(Session& session, Phase phase)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);
		PoolOptions PoolOptionsFor(const Session& session, Phase phase) const;

		void Apply(Session& session, const PhaseResult& result) ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);
		void Advance(Session& session, const Transition& transition)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);
		void Fail(Session& session, FailureReason reason, const std::string& detail)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);
		void Finish(Session& session);
		void Publish(Session& session, EventKind kind, EventPayload payload)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(session.mu);

		RequirementsCapability& capability_;
		const OrchestratorOptions options_;
		EventBroadcaster events_;
		ClarificationGate gate_;
		SessionRegistry sessions_;

		// Serializes Submit against Shutdown
		absl::Mutex lifecycle_mu_;
		std::atomic<bool> shutdown_{false};
		// Wakes the reaper on shutdown
		absl::CondVar shutdown_cv_;
		std::thread reaper_thread_;
};

} // namespace Reqflow

#endif // REQFLOW_WORKFLOW_ORCHESTRATOR_H_
