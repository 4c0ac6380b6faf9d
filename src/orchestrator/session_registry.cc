#include "session_registry.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/call_status.h"

namespace Reqflow {

namespace {

bool Finished(Session& session) {
	absl::MutexLock lock(&session.mu);
	return session.finished;
}

} // namespace

Session::~Session() {
	if (!driver.joinable()) return;
	// The driver may drop the last reference itself.
	if (driver.get_id() == std::this_thread::get_id()) {
		driver.detach();
	} else {
		driver.join();
	}
}

absl::StatusOr<std::shared_ptr<Session>> SessionRegistry::Create(const std::string& correlation_id,
		WorkflowConfig config, std::shared_ptr<Session>* replaced) {
	absl::MutexLock lock(&mu_);
	auto it = sessions_.find(correlation_id);
	if (it != sessions_.end()) {
		if (!Finished(*it->second)) {
			return DuplicateRunError(correlation_id);
		}
		if (replaced != nullptr) *replaced = std::move(it->second);
		sessions_.erase(it);
		VLOG(1) << "Replacing finished session " << correlation_id;
	}
	auto session = std::make_shared<Session>(correlation_id, std::move(config));
	sessions_.emplace(correlation_id, session);
	return session;
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& correlation_id) const {
	absl::MutexLock lock(&mu_);
	auto it = sessions_.find(correlation_id);
	return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::EraseFinished(const std::string& correlation_id) {
	absl::MutexLock lock(&mu_);
	auto it = sessions_.find(correlation_id);
	if (it == sessions_.end() || !Finished(*it->second)) return nullptr;
	std::shared_ptr<Session> session = std::move(it->second);
	sessions_.erase(it);
	return session;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::Clear() {
	absl::MutexLock lock(&mu_);
	std::vector<std::shared_ptr<Session>> all;
	all.reserve(sessions_.size());
	for (auto& [id, session] : sessions_) all.push_back(std::move(session));
	sessions_.clear();
	return all;
}

size_t SessionRegistry::size() const {
	absl::MutexLock lock(&mu_);
	return sessions_.size();
}

} // namespace Reqflow
