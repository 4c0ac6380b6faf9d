#ifndef REQFLOW_SESSION_REGISTRY_H_
#define REQFLOW_SESSION_REGISTRY_H_

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "common/workflow_config.h"
#include "common/workflow_types.h"

namespace Reqflow {

/**
 * State of one submitted run. `run` is mutated only by the orchestrator
 * while holding `mu`; phase transitions and their events happen under it.
 */
struct Session {
	Session(std::string id, WorkflowConfig cfg)
		: correlation_id(std::move(id)), config(std::move(cfg)) {}
	~Session();

	const std::string correlation_id;
	const WorkflowConfig config;
	CancellationToken token;
	std::vector<SourceDocument> documents;

	absl::Mutex mu;
	absl::CondVar done_cv;
	WorkflowRun run ABSL_GUARDED_BY(mu);
	int rewrite_rounds ABSL_GUARDED_BY(mu) = 0;
	// Set by the driver once workflow_result was published.
	bool finished ABSL_GUARDED_BY(mu) = false;

	std::thread driver;
};

/**
 * Sessions keyed by correlation id. A session is active until its driver
 * finished; only then may the id be submitted again.
 */
class SessionRegistry {
	public:
		/**
		 * AlreadyExists while a session with this id is active. A finished
		 * session is replaced; it is returned through `replaced` so the caller
		 * releases it outside the registry lock.
		 */
		absl::StatusOr<std::shared_ptr<Session>> Create(const std::string& correlation_id,
				WorkflowConfig config, std::shared_ptr<Session>* replaced);

		std::shared_ptr<Session> Find(const std::string& correlation_id) const;

		// Removes the session if it finished. Returns it for release outside the lock.
		std::shared_ptr<Session> EraseFinished(const std::string& correlation_id);

		std::vector<std::shared_ptr<Session>> Clear();
		size_t size() const;

	private:
		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, std::shared_ptr<Session>> sessions_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reqflow

#endif // REQFLOW_SESSION_REGISTRY_H_
