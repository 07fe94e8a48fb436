#pragma once
#include "binding.h"
#include "node_wrapper.h"
#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

namespace tether {

class ModuleContext;

/**
 * EngineBinding for the Node.js host, straight on top of v8 and libuv. Raw values are `v8::Local`s
 * reinterpreted as pointers, so they are exactly as long-lived as the v8 handle scope which created
 * them. Exceptions thrown by script are caught into `pending` and handed back to v8 when control
 * returns to the engine.
 */
class V8Binding final : public EngineBinding {
	public:
		V8Binding(v8::Isolate* isolate, v8::Local<v8::Context> context);
		V8Binding(const V8Binding&) = delete;
		~V8Binding() final;
		auto operator=(const V8Binding&) = delete;

		// Module entry, see `TETHER_MODULE`
		static void InitializeModule(
			v8::Local<v8::Object> exports,
			v8::Local<v8::Context> context,
			const std::function<void(ModuleContext&)>& init
		);

		// Hands the pending exception, if any, over to v8
		void RethrowPending();

		auto MaxTier() const -> Tier final { return kTierMax; }
		auto Loop() -> uv_loop_s* final;

		auto OpenScope() -> ScopeMarker final;
		void CloseScope(ScopeMarker marker) final;
		auto Escape(ScopeMarker marker, RawValue value) -> RawValue final;
		auto OpenCallbackScope() -> CallbackMarker final;
		void CloseCallbackScope(CallbackMarker marker) final;

		auto NewUndefined() -> RawValue final;
		auto NewNull() -> RawValue final;
		auto NewBoolean(bool value) -> RawValue final;
		auto NewNumber(double value) -> RawValue final;
		auto NewString(const std::string& value) -> RawValue final;
		auto NewBigInt(int64_t value) -> RawValue final;
		auto NewObject() -> RawValue final;
		auto NewArray(uint32_t length) -> RawValue final;
		auto NewError(ErrorType type, const std::string& message) -> RawValue final;
		auto NewFunction(const std::string& name, std::unique_ptr<FunctionEntry> entry, RawValue& out) -> bool final;
		auto NewExternal(std::unique_ptr<ExternalEntry> entry) -> RawValue final;
		auto Global() -> RawValue final;

		auto TypeOf(RawValue value) -> ValueType final;
		auto IsArray(RawValue value) -> bool final;
		auto IsError(RawValue value) -> bool final;
		auto IsPromise(RawValue value) -> bool final;
		auto BooleanValue(RawValue value) -> bool final;
		auto NumberValue(RawValue value) -> double final;
		auto StringValue(RawValue value) -> std::string final;
		auto BigIntValue(RawValue value, bool& lossless) -> int64_t final;
		auto ArrayLength(RawValue value) -> uint32_t final;
		auto ExternalValue(RawValue value) -> ExternalEntry* final;
		auto StrictEquals(RawValue left, RawValue right) -> bool final;
		auto CoerceToString(RawValue value, std::string& out) -> bool final;

		auto Get(RawValue object, const std::string& key, RawValue& out) -> bool final;
		auto Set(RawValue object, const std::string& key, RawValue value) -> bool final;
		auto Delete(RawValue object, const std::string& key, bool& deleted) -> bool final;
		auto GetIndex(RawValue object, uint32_t index, RawValue& out) -> bool final;
		auto SetIndex(RawValue object, uint32_t index, RawValue value) -> bool final;

		auto Call(RawValue function, RawValue receiver, const std::vector<RawValue>& argv, RawValue& out) -> bool final;

		void Throw(RawValue value) final;
		auto IsExceptionPending() -> bool final;
		auto TakeException() -> RawValue final;

		auto NewPromise(RawValue& resolver) -> RawValue final;
		auto Resolve(RawValue resolver, RawValue value) -> bool final;
		auto Reject(RawValue resolver, RawValue value) -> bool final;

		auto Reference(RawValue value) -> RawReference final;
		auto Dereference(RawReference reference) -> RawValue final;
		void Release(RawReference reference) final;

	private:
		struct FunctionRecord;
		struct ExternalRecord;

		static void FunctionCallback(const v8::FunctionCallbackInfo<v8::Value>& info);
		static void WeakCallback(const v8::WeakCallbackInfo<ExternalRecord>& info);
		static void FunctionWeakCallback(const v8::WeakCallbackInfo<FunctionRecord>& info);
		// Finalizers and collected functions are handled from the event loop
		void StartFinalizers();
		void RunFinalizers();

		auto CurrentContext() -> v8::Local<v8::Context>;
		auto MakeString(const std::string& value) -> v8::Local<v8::String>;
		// Runs `fn`, and on failure moves whatever it threw into `pending`
		template <class Fn>
		auto Attempt(Fn fn) -> bool;

		v8::Isolate* isolate;
		v8::Global<v8::Context> context;
		v8::Global<v8::Value> pending;
		std::unordered_set<FunctionRecord*> functions;
		std::vector<FunctionRecord*> collected_functions;
		std::unordered_set<ExternalRecord*> externals;
		std::vector<ExternalRecord*> finalizers;
		uv_async_t* finalizer_async = nullptr;
};

} // namespace tether
