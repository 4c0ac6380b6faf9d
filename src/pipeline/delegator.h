#ifndef REQFLOW_DELEGATOR_H_
#define REQFLOW_DELEGATOR_H_

#include <string>
#include <vector>

#include "common/cancellation.h"
#include "common/workflow_types.h"
#include "phase_handler.h"
#include "worker_pool.h"

namespace Reqflow {

class EventBroadcaster;

// Agent name carried in progress events, e.g. "ValidationDelegator".
const char* DelegatorName(Phase phase);

/**
 * Runs one phase of one workflow run: fans the units out to a bounded
 * WorkerPool, aggregates outcomes and reports progress as agent_message
 * events on the run's channel.
 */
class Delegator {
	public:
		/**
		 * @param events may be null; progress is then only logged
		 */
		Delegator(std::string correlation_id, PhaseHandler& handler, PoolOptions options,
				EventBroadcaster* events);

		/**
		 * Never fails as a whole: handler errors become error outcomes of their
		 * item. The result has one outcome per distinct input id.
		 */
		PhaseResult RunPhase(const std::vector<RequirementItem>& units, const CancellationToken& token);

		Phase phase() const { return handler_.phase(); }
		int MaxObservedInFlight() const { return pool_.MaxObservedInFlight(); }

	private:
		void Emit(EventPayload payload);

		const std::string correlation_id_;
		PhaseHandler& handler_;
		WorkerPool<RequirementItem, HandlerResult> pool_;
		EventBroadcaster* events_;
};

} // namespace Reqflow

#endif // REQFLOW_DELEGATOR_H_
