#ifndef REQFLOW_TASK_QUEUE_H_
#define REQFLOW_TASK_QUEUE_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace Reqflow {

template <typename T>
struct WorkItem {
	std::string id;
	T payload;
};

/**
 * Ordered work units of one phase. The order is the order the aggregator
 * walks when computing statistics, never the completion order.
 * Immutable once built.
 */
template <typename T>
class TaskQueue {
	public:
		static absl::StatusOr<TaskQueue<T>> Build(std::vector<WorkItem<T>> items) {
			absl::flat_hash_set<std::string> seen;
			seen.reserve(items.size());
			for (const auto& item : items) {
				if (item.id.empty()) {
					return absl::InvalidArgumentError("work item with empty id");
				}
				if (!seen.insert(item.id).second) {
					return absl::InvalidArgumentError(absl::StrCat("duplicate work item id: ", item.id));
				}
			}
			return TaskQueue<T>(std::move(items));
		}

		size_t size() const { return items_.size(); }
		bool empty() const { return items_.empty(); }
		const WorkItem<T>& at(size_t i) const { return items_.at(i); }

		std::vector<std::string> Ids() const {
			std::vector<std::string> ids;
			ids.reserve(items_.size());
			for (const auto& item : items_) ids.push_back(item.id);
			return ids;
		}

		typename std::vector<WorkItem<T>>::const_iterator begin() const { return items_.begin(); }
		typename std::vector<WorkItem<T>>::const_iterator end() const { return items_.end(); }

	private:
		explicit TaskQueue(std::vector<WorkItem<T>> items) : items_(std::move(items)) {}

		std::vector<WorkItem<T>> items_;
};

} // namespace Reqflow

#endif // REQFLOW_TASK_QUEUE_H_
