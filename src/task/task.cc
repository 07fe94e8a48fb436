#include "task.h"
#include "lib/log.h"
#include "lib/thread_pool.h"

namespace tether {
namespace detail {

/**
 * TaskJob implementation
 */
void TaskJob::Entry(void* param) {
	std::unique_ptr<TaskJob> job{static_cast<TaskJob*>(param)};
	std::optional<ExternalError> error;
	try {
		job->task->Work();
	} catch (...) {
		error = ErrorTranslator::FromCurrentException();
		Log().warn("Task work failed: {}", error->Describe());
	}
	Channel sender{job->channel};
	auto completion = [
		task = std::move(job->task),
		error = std::move(error),
		keep_alive = std::move(job->channel)
	](TaskContext& cx) mutable {
		task->Complete(cx, error ? &*error : nullptr);
	};
	if (!sender.TrySend(std::move(completion))) {
		Log().warn("Task completion could not be delivered");
	}
}

} // namespace detail

/**
 * Task implementation
 */
void Task::Run(Context& cx, std::unique_ptr<Task> task) {
	cx.Check();
	Run(cx, std::move(task), cx.GetEnvironment().SystemChannel());
}

void Task::Run(Context& cx, std::unique_ptr<Task> task, Channel channel) {
	cx.Check();
	RequireTier(cx.ActiveTier(), kTierThreadsafe, "Task");
	auto& pool = cx.GetEnvironment().Pool();
	// Holds the event loop open until the completion has run
	channel.Reference(cx);
	auto job = std::make_unique<detail::TaskJob>(std::move(task), std::move(channel));
	if (!pool.exec(&detail::TaskJob::Entry, job.get())) {
		throw ChannelClosedError{"The worker pool has shut down"};
	}
	job.release();
}

} // namespace tether
