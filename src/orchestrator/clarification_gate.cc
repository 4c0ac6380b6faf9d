#include "clarification_gate.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"

#include "events/event_broadcaster.h"

namespace Reqflow {

namespace {
// Await re-checks the run token at least this often.
constexpr std::chrono::milliseconds kTokenPollInterval{100};
} // namespace

const char* AnswerStatusName(AnswerStatus status) {
	switch (status) {
		case AnswerStatus::kOk: return "ok";
		case AnswerStatus::kAlreadyAnswered: return "already-answered";
		case AnswerStatus::kNotFound: return "not-found";
	}
	return "unknown";
}

ClarificationGate::ClarificationGate(EventBroadcaster* events) : events_(events) {}

absl::Status ClarificationGate::Open(const ClarificationQuestion& question) {
	{
		absl::MutexLock lock(&mu_);
		if (records_.contains(question.question_id)) {
			return absl::AlreadyExistsError(absl::StrCat("question exists: ", question.question_id));
		}
		auto record = std::make_unique<Record>();
		record->question = question;
		records_.emplace(question.question_id, std::move(record));
	}
	LOG(INFO) << "[" << question.correlation_id << "] question " << question.question_id
		<< " opened for item " << question.item_id;
	if (events_ != nullptr) {
		auto seq = events_->Publish(question.correlation_id, EventKind::Question, {
			{"question_id", question.question_id},
			{"item_id", question.item_id},
			{"issue", IssueKindName(question.issue)},
			{"prompt", question.prompt},
			{"options", absl::StrJoin(question.options, "|")},
		});
		if (!seq.ok()) {
			LOG(WARNING) << "[" << question.correlation_id << "] question event dropped: " << seq.status();
		}
	}
	return absl::OkStatus();
}

bool ClarificationGate::Resolve(Record& record, ClarificationAnswer answer) {
	if (record.answer.has_value()) return false;
	answer.question_id = record.question.question_id;
	answer.answered_at = std::chrono::system_clock::now();
	record.answer = std::move(answer);
	resolved_cv_.SignalAll();
	return true;
}

ClarificationAnswer ClarificationGate::Await(const std::string& question_id,
		std::chrono::milliseconds timeout, const CancellationToken& token) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	absl::MutexLock lock(&mu_);
	while (true) {
		auto it = records_.find(question_id);
		if (it == records_.end()) {
			ClarificationAnswer gone;
			gone.question_id = question_id;
			gone.cancelled = true;
			return gone;
		}
		Record& record = *it->second;
		if (record.answer.has_value()) return *record.answer;

		auto now = std::chrono::steady_clock::now();
		if (token.IsCancelled()) {
			ClarificationAnswer cancelled;
			cancelled.cancelled = true;
			Resolve(record, std::move(cancelled));
			continue;
		}
		if (now >= deadline) {
			ClarificationAnswer timed_out;
			timed_out.value = kTimeoutValue;
			timed_out.timed_out = true;
			Resolve(record, std::move(timed_out));
			LOG(WARNING) << "[" << record.question.correlation_id << "] question " << question_id
				<< " timed out; item goes to manual review";
			continue;
		}
		auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now, kTokenPollInterval);
		resolved_cv_.WaitWithTimeout(&mu_, absl::FromChrono(wait));
	}
}

AnswerStatus ClarificationGate::Answer(const std::string& correlation_id,
		const std::string& question_id, const std::string& value) {
	absl::MutexLock lock(&mu_);
	auto it = records_.find(question_id);
	if (it == records_.end() || it->second->question.correlation_id != correlation_id) {
		return AnswerStatus::kNotFound;
	}
	ClarificationAnswer answer;
	answer.value = value;
	if (!Resolve(*it->second, std::move(answer))) {
		VLOG(1) << "[" << correlation_id << "] late answer for " << question_id << " rejected";
		return AnswerStatus::kAlreadyAnswered;
	}
	VLOG(1) << "[" << correlation_id << "] question " << question_id << " answered";
	return AnswerStatus::kOk;
}

void ClarificationGate::CancelAll(const std::string& correlation_id) {
	absl::MutexLock lock(&mu_);
	size_t cancelled = 0;
	for (auto& [id, record] : records_) {
		if (record->question.correlation_id != correlation_id) continue;
		ClarificationAnswer answer;
		answer.cancelled = true;
		if (Resolve(*record, std::move(answer))) cancelled++;
	}
	if (cancelled > 0) {
		LOG(INFO) << "[" << correlation_id << "] cancelled " << cancelled << " pending questions";
	}
}

void ClarificationGate::Forget(const std::string& correlation_id) {
	absl::MutexLock lock(&mu_);
	for (auto it = records_.begin(); it != records_.end();) {
		if (it->second->question.correlation_id == correlation_id) {
			records_.erase(it++);
		} else {
			++it;
		}
	}
	resolved_cv_.SignalAll();
}

size_t ClarificationGate::PendingCount(const std::string& correlation_id) const {
	absl::MutexLock lock(&mu_);
	size_t pending = 0;
	for (const auto& [id, record] : records_) {
		if (record->question.correlation_id == correlation_id && !record->answer.has_value()) pending++;
	}
	return pending;
}

std::optional<ClarificationAnswer> ClarificationGate::Resolution(const std::string& question_id) const {
	absl::MutexLock lock(&mu_);
	auto it = records_.find(question_id);
	if (it == records_.end()) return std::nullopt;
	return it->second->answer;
}

} // namespace Reqflow
