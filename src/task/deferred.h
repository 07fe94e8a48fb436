#pragma once
#include "channel/channel.h"
#include "context/context.h"
#include "context/convert.h"
#include "error/translator.h"
#include "scope/root.h"
#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>

namespace tether {
namespace detail {

// Shared by every copy of a Deferred. The first settle claims it, from any thread.
class DeferredState {
	public:
		DeferredState(Root<JsValue> resolver, Channel channel);
		DeferredState(const DeferredState&) = delete;
		~DeferredState();
		auto operator=(const DeferredState&) = delete;

		// True if this call won the right to settle the promise
		auto Claim() -> bool { return !settled.exchange(true); }
		// Gives back a claim whose settlement could not be delivered
		void Unclaim() { settled = false; }
		auto IsSettled() const -> bool { return settled; }
		auto GetChannel() -> Channel& { return channel; }

		// Engine thread. An empty `value` settles with `undefined`.
		void Complete(Context& cx, bool resolve, Handle<JsValue> value);

	private:
		Root<JsValue> resolver;
		Channel channel;
		std::atomic<bool> settled{false};
};

} // namespace detail

/**
 * The native side of a promise. Deferred is a thread-safe token which can be copied and moved to any
 * thread; exactly one settle succeeds. If every copy is destroyed before the promise settles, the
 * promise is rejected rather than left pending forever.
 */
class Deferred {
	public:
		static auto New(Context& cx) -> std::pair<Deferred, Handle<JsPromise>>;

		// Throw `DeferredAlreadySettledError` if the promise was already settled
		void Resolve(Context& cx, Handle<JsValue> value);
		void Reject(Context& cx, Handle<JsValue> error);

		// Claims the promise now, then runs `fn(TaskContext&)` on the engine thread via `channel` and
		// resolves with its result. Anything `fn` throws rejects the promise instead. If `channel` is
		// closed this throws `ChannelClosedError` and the promise is left unclaimed.
		template <class Fn>
		void Settle(const Channel& channel, Fn fn);
		template <class Fn>
		void Settle(Fn fn);

		// Same, but runs `fn()` immediately
		template <class Fn>
		void SettleWith(Context& cx, Fn fn);

		auto IsSettled() const -> bool { return state->IsSettled(); }

	private:
		explicit Deferred(std::shared_ptr<detail::DeferredState> state) : state{std::move(state)} {}

		void Claim();
		template <class Fn>
		static void Fulfill(Context& cx, detail::DeferredState& state, Fn&& fn);

		std::shared_ptr<detail::DeferredState> state;
};

template <class Fn>
void Deferred::Fulfill(Context& cx, detail::DeferredState& state, Fn&& fn) {
	Handle<JsValue> value;
	bool resolve = true;
	try {
		if constexpr (std::is_void<decltype(fn())>::value) {
			fn();
		} else {
			value = ToEngine(cx, fn());
		}
	} catch (...) {
		value = ErrorTranslator::CaughtToEngine(cx);
		resolve = false;
	}
	state.Complete(cx, resolve, value);
}

template <class Fn>
void Deferred::Settle(const Channel& channel, Fn fn) {
	Claim();
	Channel target = channel;
	try {
		target.Send([state = state, fn = std::move(fn)](TaskContext& cx) mutable {
			Fulfill(cx, *state, [&]() { return fn(cx); });
		});
	} catch (const ChannelClosedError&) {
		state->Unclaim();
		throw;
	}
}

template <class Fn>
void Deferred::Settle(Fn fn) {
	Settle(state->GetChannel(), std::move(fn));
}

template <class Fn>
void Deferred::SettleWith(Context& cx, Fn fn) {
	cx.Check();
	Claim();
	Fulfill(cx, *state, fn);
}

} // namespace tether
