#pragma once
#include "context/context.h"
#include "error/error.h"
#include "error/translator.h"
#include "lib/lockable.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

struct uv_async_s;

namespace tether {
namespace detail {

// One closure queued on a channel
class ChannelTask {
	public:
		ChannelTask() = default;
		ChannelTask(const ChannelTask&) = delete;
		virtual ~ChannelTask() = default;
		auto operator=(const ChannelTask&) = delete;

		virtual void Run(TaskContext& cx) = 0;
};

template <class Fn>
class ChannelTaskImpl final : public ChannelTask {
	public:
		explicit ChannelTaskImpl(Fn fn) : fn{std::move(fn)} {}
		void Run(TaskContext& cx) final { fn(cx); }

	private:
		Fn fn;
};

// Where `SendAndWait` parks
struct WaitState {
	enum class Status { Pending, Done, Failed, Dropped };
	Status status = Status::Pending;
	ExternalError error;
};
using Waiter = lockable_t<WaitState, true>;

// Reports back to a waiting sender. If the closure is destroyed without running, the waiter learns
// the channel closed under it.
class WaitingTaskBase : public ChannelTask {
	public:
		explicit WaitingTaskBase(std::shared_ptr<Waiter> waiter) : waiter{std::move(waiter)} {}
		WaitingTaskBase(const WaitingTaskBase&) = delete;
		~WaitingTaskBase() override;
		auto operator=(const WaitingTaskBase&) = delete;

	protected:
		void Finish(WaitState::Status status, ExternalError error = {});

	private:
		std::shared_ptr<Waiter> waiter;
		bool finished = false;
};

template <class Fn>
class WaitingTask final : public WaitingTaskBase {
	public:
		WaitingTask(Fn fn, std::shared_ptr<Waiter> waiter) : WaitingTaskBase{std::move(waiter)}, fn{std::move(fn)} {}

		void Run(TaskContext& cx) final {
			try {
				fn(cx);
			} catch (...) {
				Finish(WaitState::Status::Failed, ErrorTranslator::FromCaughtException(cx));
				return;
			}
			Finish(WaitState::Status::Done);
		}

	private:
		Fn fn;
};

/**
 * State shared by every clone of a channel. The receiving side is a `uv_async_t` on the engine's
 * event loop which drains the queue each time it fires. `senders` counts live `Channel` objects;
 * `ref_count` counts the ones holding the event loop open.
 */
class ChannelState {
	public:
		explicit ChannelState(Environment& env);
		ChannelState(const ChannelState&) = delete;
		~ChannelState() = default;
		auto operator=(const ChannelState&) = delete;

		// Returns false if the channel is closed. `task` is destroyed outside the queue lock.
		auto Enqueue(std::unique_ptr<ChannelTask> task) -> bool;
		// Engine thread only. Pending closures are destroyed without running. May destroy `this`.
		void Close();

		void AddSender() { ++senders; }
		void RemoveSender();
		// Engine thread only
		void Ref();
		// Only valid while another reference is held
		void AddRef() { ++ref_count; }
		void Unref();

		auto IsClosed() const -> bool;
		auto Pending() const -> size_t;
		auto EngineThread() const -> std::thread::id { return engine_thread; }

	private:
		struct Queue {
			std::deque<std::unique_ptr<ChannelTask>> tasks;
			bool closed = false;
		};

		void Drain();
		void Wake();

		Environment& env;
		std::thread::id engine_thread;
		uv_async_s* uv_async;
		lockable_t<Queue> queue;
		std::atomic<size_t> senders{0};
		std::atomic<size_t> ref_count{0};
};

} // namespace detail

/**
 * Sends closures from any thread to run on the engine thread, each under a fresh `TaskContext`.
 * Closures from one sending thread run in the order they were sent. A Channel can be copied freely
 * and each copy is a sender; once the last one is gone the receiving side shuts down after the queue
 * is drained. A referenced channel keeps the host event loop alive.
 */
class Channel {
	friend class Environment;

	public:
		explicit Channel(Context& cx);
		Channel(const Channel& that);
		Channel(Channel&& that) noexcept;
		~Channel();
		auto operator=(const Channel& that) -> Channel&;
		auto operator=(Channel&& that) noexcept -> Channel&;

		// Throws `ChannelClosedError` if the receiving side is gone
		template <class Fn>
		void Send(Fn fn);

		// Returns false instead of throwing
		template <class Fn>
		auto TrySend(Fn fn) -> bool;

		// Sends, then blocks until the closure has run. An error thrown by the closure is rethrown
		// here. On timeout this throws `TimeoutError` and the closure still runs later. Calling this
		// on the engine thread would deadlock and fails with `ContextReentrancyError`.
		template <class Fn>
		void SendAndWait(Fn fn, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

		void Reference(Context& cx);
		void Unreference(Context& cx);
		auto HasRef() const -> bool { return has_ref; }
		auto IsClosed() const -> bool;
		// Closures sent but not yet run
		auto Pending() const -> size_t;

	private:
		Channel(Environment& env, bool referenced);

		void Release();
		void SendTask(std::unique_ptr<detail::ChannelTask> task);
		auto TrySendTask(std::unique_ptr<detail::ChannelTask> task) -> bool;
		void SendTaskAndWait(
			std::unique_ptr<detail::ChannelTask> task,
			const std::shared_ptr<detail::Waiter>& waiter,
			std::optional<std::chrono::milliseconds> timeout
		);

		std::shared_ptr<detail::ChannelState> state;
		bool has_ref = false;
};

template <class Fn>
void Channel::Send(Fn fn) {
	SendTask(std::make_unique<detail::ChannelTaskImpl<Fn>>(std::move(fn)));
}

template <class Fn>
auto Channel::TrySend(Fn fn) -> bool {
	return TrySendTask(std::make_unique<detail::ChannelTaskImpl<Fn>>(std::move(fn)));
}

template <class Fn>
void Channel::SendAndWait(Fn fn, std::optional<std::chrono::milliseconds> timeout) {
	auto waiter = std::make_shared<detail::Waiter>();
	SendTaskAndWait(std::make_unique<detail::WaitingTask<Fn>>(std::move(fn), waiter), waiter, timeout);
}

} // namespace tether
