#include "channel.h"
#include "lib/log.h"
#include <uv.h>

namespace tether {
namespace detail {

/**
 * WaitingTaskBase implementation
 */
WaitingTaskBase::~WaitingTaskBase() {
	if (!finished) {
		Finish(WaitState::Status::Dropped);
	}
}

void WaitingTaskBase::Finish(WaitState::Status status, ExternalError error) {
	finished = true;
	{
		auto lock = waiter->write();
		lock->status = status;
		lock->error = std::move(error);
	}
	waiter->notify_all();
}

/**
 * ChannelState implementation
 */
ChannelState::ChannelState(Environment& env) :
		env{env},
		engine_thread{env.EngineThread()},
		uv_async{new uv_async_t} {
	uv_async_init(env.Binding().Loop(), uv_async, [](uv_async_t* async) {
		static_cast<ChannelState*>(async->data)->Drain();
	});
	uv_async->data = this;
	uv_unref(reinterpret_cast<uv_handle_t*>(uv_async));
}

auto ChannelState::Enqueue(std::unique_ptr<ChannelTask> task) -> bool {
	std::unique_ptr<ChannelTask> rejected;
	{
		auto lock = queue.write();
		if (lock->closed) {
			rejected = std::move(task);
		} else {
			lock->tasks.push_back(std::move(task));
			uv_async_send(uv_async);
			return true;
		}
	}
	return false;
}

void ChannelState::Close() {
	std::deque<std::unique_ptr<ChannelTask>> dropped;
	{
		auto lock = queue.write();
		if (lock->closed) {
			return;
		}
		lock->closed = true;
		dropped = std::exchange(lock->tasks, {});
	}
	uv_close(reinterpret_cast<uv_handle_t*>(uv_async), [](uv_handle_t* handle) {
		delete reinterpret_cast<uv_async_t*>(handle);
	});
	if (!dropped.empty()) {
		Log().warn("Channel closed with {} closure(s) that never ran", dropped.size());
	}
	// These destructors may send to other channels, so the lock must not be held
	dropped.clear();
	env.UnregisterChannel(this);
}

void ChannelState::RemoveSender() {
	if (--senders == 0) {
		// The receiving side is closed from the event loop, once anything still queued has run
		Wake();
	}
}

void ChannelState::Ref() {
	if (ref_count++ == 0 && !IsClosed()) {
		uv_ref(reinterpret_cast<uv_handle_t*>(uv_async));
	}
}

void ChannelState::Unref() {
	if (--ref_count == 0) {
		if (std::this_thread::get_id() == engine_thread) {
			if (!IsClosed()) {
				uv_unref(reinterpret_cast<uv_handle_t*>(uv_async));
			}
		} else {
			// Wake up the loop so the handle is unreferenced from the engine thread
			Wake();
		}
	}
}

auto ChannelState::IsClosed() const -> bool {
	return queue.read()->closed;
}

auto ChannelState::Pending() const -> size_t {
	return queue.read()->tasks.size();
}

void ChannelState::Wake() {
	auto lock = queue.write();
	if (!lock->closed) {
		uv_async_send(uv_async);
	}
}

void ChannelState::Drain() {
	auto tasks = std::exchange(queue.write()->tasks, {});
	for (auto& task : tasks) {
		env.RunInTaskContext([&](TaskContext& cx) {
			task->Run(cx);
		});
		// Closures hold references (including channels), let them go on the engine thread
		task.reset();
	}
	if (senders == 0) {
		Close();
		// `this` may be gone
		return;
	}
	if (ref_count == 0 && !IsClosed()) {
		uv_unref(reinterpret_cast<uv_handle_t*>(uv_async));
	}
}

} // namespace detail

/**
 * Channel implementation
 */
Channel::Channel(Context& cx) {
	cx.Check();
	auto& env = cx.GetEnvironment();
	RequireTier(env.ActiveTier(), kTierThreadsafe, "Channel");
	if (!env.GetConfig().tasks) {
		throw UnsupportedCapabilityError{"The task subsystem is disabled"};
	}
	state = std::make_shared<detail::ChannelState>(env);
	env.RegisterChannel(state);
	state->AddSender();
	Reference(cx);
}

Channel::Channel(Environment& env, bool referenced) :
		state{std::make_shared<detail::ChannelState>(env)} {
	env.RegisterChannel(state);
	state->AddSender();
	if (referenced) {
		has_ref = true;
		state->Ref();
	}
}

Channel::Channel(const Channel& that) : state{that.state}, has_ref{that.has_ref} {
	if (state) {
		state->AddSender();
		if (has_ref) {
			state->AddRef();
		}
	}
}

Channel::Channel(Channel&& that) noexcept :
	state{std::move(that.state)}, has_ref{std::exchange(that.has_ref, false)} {}

Channel::~Channel() {
	Release();
}

auto Channel::operator=(const Channel& that) -> Channel& {
	if (this != &that) {
		Channel copy{that};
		*this = std::move(copy);
	}
	return *this;
}

auto Channel::operator=(Channel&& that) noexcept -> Channel& {
	if (this != &that) {
		Release();
		state = std::move(that.state);
		has_ref = std::exchange(that.has_ref, false);
	}
	return *this;
}

void Channel::Reference(Context& cx) {
	cx.Check();
	if (state && !has_ref) {
		has_ref = true;
		state->Ref();
	}
}

void Channel::Unreference(Context& cx) {
	cx.Check();
	if (state && has_ref) {
		has_ref = false;
		state->Unref();
	}
}

auto Channel::IsClosed() const -> bool {
	return !state || state->IsClosed();
}

auto Channel::Pending() const -> size_t {
	return state ? state->Pending() : 0;
}

void Channel::Release() {
	if (state) {
		if (has_ref) {
			has_ref = false;
			state->Unref();
		}
		state->RemoveSender();
		state.reset();
	}
}

void Channel::SendTask(std::unique_ptr<detail::ChannelTask> task) {
	if (!TrySendTask(std::move(task))) {
		throw ChannelClosedError{"Channel is closed"};
	}
}

auto Channel::TrySendTask(std::unique_ptr<detail::ChannelTask> task) -> bool {
	if (!state || !state->Enqueue(std::move(task))) {
		Log().warn("Dropped a closure sent to a closed channel");
		return false;
	}
	return true;
}

void Channel::SendTaskAndWait(
	std::unique_ptr<detail::ChannelTask> task,
	const std::shared_ptr<detail::Waiter>& waiter,
	std::optional<std::chrono::milliseconds> timeout
) {
	if (state && std::this_thread::get_id() == state->EngineThread()) {
		throw ContextReentrancyError{"SendAndWait would block the engine thread"};
	}
	SendTask(std::move(task));
	auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds{0});
	auto lock = waiter->write();
	while (lock->status == detail::WaitState::Status::Pending) {
		if (timeout) {
			if (!lock.wait_until(deadline) && lock->status == detail::WaitState::Status::Pending) {
				throw TimeoutError{"Timed out waiting for the engine thread"};
			}
		} else {
			lock.wait();
		}
	}
	switch (lock->status) {
		case detail::WaitState::Status::Failed:
			throw RuntimeExternalError{lock->error};
		case detail::WaitState::Status::Dropped:
			throw ChannelClosedError{"Channel closed before the closure ran"};
		default:
			break;
	}
}

} // namespace tether
