#include "deferred.h"
#include "lib/log.h"

namespace tether {
namespace detail {

/**
 * DeferredState implementation
 */
DeferredState::DeferredState(Root<JsValue> resolver, Channel channel) :
	resolver{std::move(resolver)}, channel{std::move(channel)} {}

DeferredState::~DeferredState() {
	if (!Claim()) {
		return;
	}
	Log().warn("Deferred was dropped without being settled");
	// This may be any thread, so the rejection is delivered like any other closure. The closure
	// keeps the channel's loop reference until it has run.
	Channel sender{channel};
	sender.TrySend([resolver = std::move(resolver), keep_alive = std::move(channel)](TaskContext& cx) mutable {
		auto error = cx.Error("Deferred was dropped without being settled");
		auto raw_resolver = cx.Unwrap(resolver.Into(cx));
		auto raw_error = cx.Unwrap(error);
		resolver.Drop(cx);
		auto& binding = cx.Binding();
		cx.RunScript([&]() { return binding.Reject(raw_resolver, raw_error); });
	});
}

void DeferredState::Complete(Context& cx, bool resolve, Handle<JsValue> value) {
	cx.Check();
	if (value.IsEmpty()) {
		value = cx.Undefined();
	}
	auto raw_resolver = cx.Unwrap(resolver.Into(cx));
	auto raw_value = cx.Unwrap(value);
	resolver.Drop(cx);
	channel.Unreference(cx);
	auto& binding = cx.Binding();
	cx.RunScript([&]() {
		return resolve ? binding.Resolve(raw_resolver, raw_value) : binding.Reject(raw_resolver, raw_value);
	});
}

} // namespace detail

/**
 * Deferred implementation
 */
auto Deferred::New(Context& cx) -> std::pair<Deferred, Handle<JsPromise>> {
	cx.Check();
	RequireTier(cx.ActiveTier(), kTierPromise, "Promise");
	auto& binding = cx.Binding();
	RawValue raw_resolver = nullptr;
	RawValue raw_promise = binding.NewPromise(raw_resolver);
	auto promise = cx.Wrap<JsPromise>(raw_promise);
	Root<JsValue> resolver{cx, cx.Wrap(raw_resolver)};
	// Holds the event loop open until the promise is settled
	Channel channel{cx.GetEnvironment().SystemChannel()};
	channel.Reference(cx);
	auto state = std::make_shared<detail::DeferredState>(std::move(resolver), std::move(channel));
	return {Deferred{std::move(state)}, promise};
}

void Deferred::Resolve(Context& cx, Handle<JsValue> value) {
	cx.Check();
	Claim();
	state->Complete(cx, true, value);
}

void Deferred::Reject(Context& cx, Handle<JsValue> error) {
	cx.Check();
	Claim();
	state->Complete(cx, false, error);
}

void Deferred::Claim() {
	if (!state->Claim()) {
		Log().warn("Deferred settled more than once");
		throw DeferredAlreadySettledError{"Deferred has already been settled"};
	}
}

} // namespace tether
