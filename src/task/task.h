#pragma once
#include "channel/channel.h"
#include "context/context.h"
#include "context/convert.h"
#include "deferred.h"
#include "error/external_error.h"
#include "error/translator.h"
#include "outcome.h"
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace tether {

/**
 * A unit of work for the worker pool. `Work` runs on a pool thread with no Context and must not touch
 * handles. `Complete` then runs on the engine thread, delivered through a Channel. If `Work` threw,
 * `error` describes what went wrong; otherwise it is null.
 *
 * Work is not cancellable once it has been submitted.
 */
class Task {
	public:
		Task() = default;
		Task(const Task&) = delete;
		virtual ~Task() = default;
		auto operator=(const Task&) = delete;

		virtual void Work() = 0;
		virtual void Complete(TaskContext& cx, const ExternalError* error) = 0;

		// Submits `task` to the worker pool. The completion is delivered on `channel`, or on the
		// environment's internal channel, and the event loop is held open until it runs.
		static void Run(Context& cx, std::unique_ptr<Task> task);
		static void Run(Context& cx, std::unique_ptr<Task> task, Channel channel);

		// `work()` returns `T` or `Outcome<T>`, and `complete(TaskContext&, Outcome<T>)` receives it
		template <class WorkFn, class CompleteFn>
		static void Spawn(Context& cx, WorkFn work, CompleteFn complete);
		template <class WorkFn, class CompleteFn>
		static void Spawn(Context& cx, Channel channel, WorkFn work, CompleteFn complete);

		// Returns a promise for the result of `work()`. By default the result is converted with
		// `ToEngine`, otherwise `settle(TaskContext&, T)` builds the value. A failed outcome or a throwing
		// `settle` rejects the promise.
		template <class WorkFn>
		static auto Promise(Context& cx, WorkFn work) -> Handle<JsPromise>;
		template <class WorkFn, class SettleFn>
		static auto Promise(Context& cx, WorkFn work, SettleFn settle) -> Handle<JsPromise>;
};

namespace detail {

// Owns a task between `Task::Run` and its completion
class TaskJob {
	public:
		TaskJob(std::unique_ptr<Task> task, Channel channel) : task{std::move(task)}, channel{std::move(channel)} {}
		static void Entry(void* param);

	private:
		std::unique_ptr<Task> task;
		Channel channel;
};

template <class WorkFn, class CompleteFn>
class FunctionTask final : public Task {
	using Result = std::invoke_result_t<WorkFn&>;
	using Value = typename OutcomeValue<Result>::type;

	public:
		FunctionTask(WorkFn work, CompleteFn complete) : work{std::move(work)}, complete{std::move(complete)} {}

		void Work() final {
			if constexpr (std::is_void<Result>::value) {
				work();
				outcome.emplace();
			} else {
				outcome.emplace(work());
			}
		}

		void Complete(TaskContext& cx, const ExternalError* error) final {
			if (error == nullptr) {
				complete(cx, std::move(*outcome));
			} else {
				complete(cx, Outcome<Value>{*error});
			}
		}

	private:
		WorkFn work;
		CompleteFn complete;
		std::optional<Outcome<Value>> outcome;
};

// Default promise settlement
struct ConvertResult {
	template <class Type>
	auto operator()(TaskContext& cx, Type value) const -> Handle<JsValue> {
		return ToEngine(cx, std::move(value));
	}

	auto operator()(TaskContext& cx) const -> Handle<JsValue> {
		return cx.Undefined();
	}
};

} // namespace detail

template <class WorkFn, class CompleteFn>
void Task::Spawn(Context& cx, Channel channel, WorkFn work, CompleteFn complete) {
	Run(cx, std::make_unique<detail::FunctionTask<WorkFn, CompleteFn>>(std::move(work), std::move(complete)), std::move(channel));
}

template <class WorkFn, class CompleteFn>
void Task::Spawn(Context& cx, WorkFn work, CompleteFn complete) {
	cx.Check();
	Spawn(cx, cx.GetEnvironment().SystemChannel(), std::move(work), std::move(complete));
}

template <class WorkFn>
auto Task::Promise(Context& cx, WorkFn work) -> Handle<JsPromise> {
	return Promise(cx, std::move(work), detail::ConvertResult{});
}

template <class WorkFn, class SettleFn>
auto Task::Promise(Context& cx, WorkFn work, SettleFn settle) -> Handle<JsPromise> {
	using Value = typename OutcomeValue<std::invoke_result_t<WorkFn&>>::type;
	auto pair = Deferred::New(cx);
	auto complete = [deferred = std::move(pair.first), settle = std::move(settle)](TaskContext& cx, Outcome<Value> outcome) mutable {
		if (!outcome.IsOk()) {
			deferred.Reject(cx, ErrorTranslator::Internalize(cx, outcome.Error()));
			return;
		}
		if constexpr (std::is_void<Value>::value) {
			deferred.SettleWith(cx, [&]() { return settle(cx); });
		} else {
			deferred.SettleWith(cx, [&]() { return settle(cx, std::move(outcome.Value())); });
		}
	};
	Spawn(cx, std::move(work), std::move(complete));
	return pair.second;
}

} // namespace tether
