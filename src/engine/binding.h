#pragma once
#include "tier.h"
#include "error/external_error.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct uv_loop_s;

namespace tether {

// Opaque engine-side pointers. What they point at is entirely up to the binding.
struct RawValueTag;
using RawValue = RawValueTag*;
struct RawReferenceTag;
using RawReference = RawReferenceTag*;
struct ScopeMarkerTag;
using ScopeMarker = ScopeMarkerTag*;
struct CallbackMarkerTag;
using CallbackMarker = CallbackMarkerTag*;

enum class ValueType { Undefined, Null, Boolean, Number, String, Symbol, Object, Function, BigInt, External };

// What the engine passed to a native function
struct CallbackArgs {
	RawValue this_value = nullptr;
	std::vector<RawValue> arguments;
	RawValue result = nullptr;
};

// Owned by the binding for as long as the engine function it backs can be called. Once the engine
// collects the function the binding destroys the entry, from the event loop as with `ExternalEntry`.
class FunctionEntry {
	public:
		virtual ~FunctionEntry() = default;
		// Returns false when an exception was left pending instead of `args.result`
		virtual auto Invoke(CallbackArgs& args) -> bool = 0;
};

// Native payload of an engine value. The binding calls `Finalize` once the engine collects the
// value, from the event loop and never from inside garbage collection, then destroys the entry.
class ExternalEntry {
	public:
		virtual ~ExternalEntry() = default;
		virtual void Finalize() = 0;
		// Identifies the native type held by this entry
		virtual auto Tag() const -> const void* = 0;
		virtual auto Data() -> void* = 0;
};

/**
 * Raw engine operations. Every operation that may run script or otherwise fail returns `false`
 * and leaves the failure in the binding's pending-exception slot. Nothing here checks scopes,
 * threads or contexts; that discipline is layered on top by `Environment` and `Context`.
 */
class EngineBinding {
	public:
		EngineBinding() = default;
		EngineBinding(const EngineBinding&) = delete;
		virtual ~EngineBinding() = default;
		auto operator=(const EngineBinding&) = delete;

		// Highest capability tier this engine supports
		virtual auto MaxTier() const -> Tier = 0;
		// Host event loop. Channels attach their wake-up handles here.
		virtual auto Loop() -> uv_loop_s* = 0;

		// Engine handle scopes, pushed and popped in lock-step with `ScopeStack`
		virtual auto OpenScope() -> ScopeMarker = 0;
		virtual void CloseScope(ScopeMarker marker) = 0;
		virtual auto Escape(ScopeMarker marker, RawValue value) -> RawValue = 0;

		// Host bookkeeping around work started from the event loop. An exception still pending when
		// the marker closes is reported to the host as uncaught.
		virtual auto OpenCallbackScope() -> CallbackMarker = 0;
		virtual void CloseCallbackScope(CallbackMarker marker) = 0;

		// Value creation
		virtual auto NewUndefined() -> RawValue = 0;
		virtual auto NewNull() -> RawValue = 0;
		virtual auto NewBoolean(bool value) -> RawValue = 0;
		virtual auto NewNumber(double value) -> RawValue = 0;
		virtual auto NewString(const std::string& value) -> RawValue = 0;
		virtual auto NewBigInt(int64_t value) -> RawValue = 0;
		virtual auto NewObject() -> RawValue = 0;
		virtual auto NewArray(uint32_t length) -> RawValue = 0;
		virtual auto NewError(ErrorType type, const std::string& message) -> RawValue = 0;
		virtual auto NewFunction(const std::string& name, std::unique_ptr<FunctionEntry> entry, RawValue& out) -> bool = 0;
		virtual auto NewExternal(std::unique_ptr<ExternalEntry> entry) -> RawValue = 0;
		virtual auto Global() -> RawValue = 0;

		// Inspection
		virtual auto TypeOf(RawValue value) -> ValueType = 0;
		virtual auto IsArray(RawValue value) -> bool = 0;
		virtual auto IsError(RawValue value) -> bool = 0;
		virtual auto IsPromise(RawValue value) -> bool = 0;
		virtual auto BooleanValue(RawValue value) -> bool = 0;
		virtual auto NumberValue(RawValue value) -> double = 0;
		virtual auto StringValue(RawValue value) -> std::string = 0;
		virtual auto BigIntValue(RawValue value, bool& lossless) -> int64_t = 0;
		virtual auto ArrayLength(RawValue value) -> uint32_t = 0;
		virtual auto ExternalValue(RawValue value) -> ExternalEntry* = 0;
		virtual auto StrictEquals(RawValue left, RawValue right) -> bool = 0;
		virtual auto CoerceToString(RawValue value, std::string& out) -> bool = 0;

		// Properties
		virtual auto Get(RawValue object, const std::string& key, RawValue& out) -> bool = 0;
		virtual auto Set(RawValue object, const std::string& key, RawValue value) -> bool = 0;
		virtual auto Delete(RawValue object, const std::string& key, bool& deleted) -> bool = 0;
		virtual auto GetIndex(RawValue object, uint32_t index, RawValue& out) -> bool = 0;
		virtual auto SetIndex(RawValue object, uint32_t index, RawValue value) -> bool = 0;

		virtual auto Call(RawValue function, RawValue receiver, const std::vector<RawValue>& argv, RawValue& out) -> bool = 0;

		// Pending-exception slot
		virtual void Throw(RawValue value) = 0;
		virtual auto IsExceptionPending() -> bool = 0;
		virtual auto TakeException() -> RawValue = 0;

		// Promises. `resolver` is an engine object only meaningful to `Resolve` and `Reject`.
		virtual auto NewPromise(RawValue& resolver) -> RawValue = 0;
		virtual auto Resolve(RawValue resolver, RawValue value) -> bool = 0;
		virtual auto Reject(RawValue resolver, RawValue value) -> bool = 0;

		// Persistent references which survive scopes. Engine thread only.
		virtual auto Reference(RawValue value) -> RawReference = 0;
		virtual auto Dereference(RawReference reference) -> RawValue = 0;
		virtual void Release(RawReference reference) = 0;
};

} // namespace tether
