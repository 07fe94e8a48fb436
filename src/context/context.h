#pragma once
#include "engine/environment.h"
#include "error/error.h"
#include "scope/handle.h"
#include "scope/scope.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tether {

/**
 * Capability token for the engine thread. A Context is created only by the `Environment` entry
 * points, one per call into native code, and at most one is active at a time. Every operation that
 * touches the engine heap goes through here and checks that (a) this is the active context on the
 * engine thread and (b) no engine exception is pending.
 */
class Context {
	public:
		Context(const Context&) = delete;
		virtual ~Context();
		auto operator=(const Context&) = delete;

		auto GetEnvironment() -> Environment& { return env; }
		auto Binding() -> EngineBinding& { return binding; }
		auto ActiveTier() const -> Tier { return env.ActiveTier(); }
		// Outermost scope owned by this context
		auto GetScope() const -> ScopeId { return scope; }

		// Throws `ContextReentrancyError` unless this is the active context on the engine thread, and
		// `PendingExceptionViolationError` if an engine exception is pending
		void Check();

		// Runs `fn(scope)` in a child scope. A handle returned by `fn` is escaped into this scope.
		template <class Fn>
		auto RunWithScope(Fn fn) -> decltype(fn(std::declval<Scope&>()));

		// Values
		auto Undefined() -> Handle<JsUndefined>;
		auto Null() -> Handle<JsNull>;
		auto Boolean(bool value) -> Handle<JsBoolean>;
		auto Number(double value) -> Handle<JsNumber>;
		auto String(const std::string& value) -> Handle<JsString>;
		auto BigInt(int64_t value) -> Handle<JsBigInt>;
		auto Object() -> Handle<JsObject>;
		auto Array(uint32_t length = 0) -> Handle<JsArray>;
		auto Error(const std::string& message, ErrorType type = ErrorType::Error) -> Handle<JsError>;
		auto Function(const std::string& name, NativeFunction function) -> Handle<JsFunction>;
		auto Global() -> Handle<JsObject>;

		// Moves `value` into an engine value. `Type::Finalize(FinalizeContext&)` is called, if it
		// exists, when the engine collects the box.
		template <class Type>
		auto Box(Type value) -> Handle<JsBox<Type>>;
		template <class Type>
		auto Unbox(Handle<JsValue> box) -> Type&;

		// Inspection
		template <class Type>
		auto Is(Handle<JsValue> value) -> bool;
		template <class Type>
		auto As(Handle<JsValue> value) -> Handle<Type>;
		auto TypeOf(Handle<JsValue> value) -> ValueType;
		auto BooleanValue(Handle<JsBoolean> value) -> bool;
		auto NumberValue(Handle<JsNumber> value) -> double;
		auto StringValue(Handle<JsString> value) -> std::string;
		auto BigIntValue(Handle<JsBigInt> value, bool* lossless = nullptr) -> int64_t;
		auto Length(Handle<JsArray> array) -> uint32_t;
		auto StrictEquals(Handle<JsValue> left, Handle<JsValue> right) -> bool;
		// Engine string conversion, which may run script
		auto ToString(Handle<JsValue> value) -> std::string;

		// Properties
		auto Get(Handle<JsObject> object, const std::string& key) -> Handle<JsValue>;
		auto Get(Handle<JsObject> object, uint32_t index) -> Handle<JsValue>;
		void Set(Handle<JsObject> object, const std::string& key, Handle<JsValue> value);
		void Set(Handle<JsObject> object, uint32_t index, Handle<JsValue> value);
		auto Delete(Handle<JsObject> object, const std::string& key) -> bool;

		auto Call(
			Handle<JsFunction> function,
			Handle<JsValue> receiver,
			const std::vector<Handle<JsValue>>& arguments = {}
		) -> Handle<JsValue>;

		// Raw access for the rest of the library
		auto Unwrap(Handle<JsValue> value) -> RawValue;
		template <class Type = JsValue>
		auto Wrap(RawValue value) -> Handle<Type>;
		// Runs a raw engine operation that may run script. The active context is suspended meanwhile,
		// and a `false` result becomes the pending-exception sentinel.
		template <class Fn>
		void RunScript(Fn fn);

	protected:
		explicit Context(Environment& env);

		Environment& env;
		EngineBinding& binding;

	private:
		ScopeId scope = 0;
};

/**
 * Contexts which are allowed to throw into the engine: function calls, task completions and module
 * initialization.
 */
class CallContext : public Context {
	public:
		// Places `error` in the engine's pending-exception slot and returns the sentinel, so the usual
		// pattern is `throw cx.Throw(error);`
		auto Throw(Handle<JsValue> error) -> RuntimeError;
		auto ThrowError(const std::string& message, ErrorType type = ErrorType::Error) -> RuntimeError;

		// Runs `fn`. If it fails with an engine exception, or a native error that can be turned into
		// one, the exception is cleared and `on_error(Handle<JsValue>)` supplies the result instead.
		// Programming errors are not caught.
		template <class Fn, class Catch>
		auto TryCatch(Fn fn, Catch on_error) -> decltype(fn());

	protected:
		using Context::Context;

	private:
		// Empty handle if `fn` returned normally
		auto CaptureFailure(const std::function<void()>& fn) -> Handle<JsValue>;
};

// Native function invocation
class FunctionContext : public CallContext {
	friend class Environment;

	public:
		auto Length() const -> size_t { return args.arguments.size(); }
		// `undefined` past the end
		auto Argument(size_t index) -> Handle<JsValue>;
		// Checked argument, throws a TypeError naming the argument
		template <class Type>
		auto Argument(size_t index) -> Handle<Type>;
		auto This() -> Handle<JsValue>;

	private:
		FunctionContext(Environment& env, CallbackArgs& args) : CallContext{env}, args{args} {}
		auto Return(Handle<JsValue> value) -> RawValue;

		CallbackArgs& args;
};

// Closures delivered by a Channel, including task completions
class TaskContext : public CallContext {
	friend class Environment;

	private:
		explicit TaskContext(Environment& env) : CallContext{env} {}
};

// Module initialization
class ModuleContext : public CallContext {
	friend class Environment;

	public:
		auto Exports() -> Handle<JsObject>;
		void Export(const std::string& name, Handle<JsValue> value);
		void ExportFunction(const std::string& name, NativeFunction function);

	private:
		ModuleContext(Environment& env, RawValue exports) : CallContext{env}, exports{exports} {}

		RawValue exports;
};

// Box finalizers. Nothing can be thrown back into the engine from here.
class FinalizeContext : public Context {
	friend class Environment;

	private:
		explicit FinalizeContext(Environment& env) : Context{env} {}
};

namespace detail {

template <class Type, class = void>
struct HasFinalize : std::false_type {};
template <class Type>
struct HasFinalize<Type, std::void_t<decltype(std::declval<Type&>().Finalize(std::declval<FinalizeContext&>()))>> :
	std::true_type {};

// Native payload of `JsBox<Type>`
template <class Type>
class BoxEntry final : public ExternalEntry {
	public:
		BoxEntry(Environment& env, Type value) : env{env}, value{std::move(value)} {}

		void Finalize() final {
			if constexpr (HasFinalize<Type>::value) {
				env.RunFinalizer([this](FinalizeContext& cx) { value.Finalize(cx); });
			}
		}

		auto Tag() const -> const void* final { return BoxTag<Type>(); }
		auto Data() -> void* final { return &value; }

	private:
		Environment& env;
		Type value;
};

} // namespace detail

template <class Fn>
auto Context::RunWithScope(Fn fn) -> decltype(fn(std::declval<Scope&>())) {
	using Result = decltype(fn(std::declval<Scope&>()));
	Scope child{*this};
	if constexpr (IsHandle<Result>::value) {
		Result result = fn(child);
		if (result.IsEmpty() || result.Scope() != child.Id()) {
			// Already escaped, or rooted further out
			return result;
		}
		return child.Escape(result);
	} else {
		return fn(child);
	}
}

template <class Type>
auto Context::Box(Type value) -> Handle<JsBox<Type>> {
	Check();
	return Wrap<JsBox<Type>>(binding.NewExternal(std::make_unique<detail::BoxEntry<Type>>(env, std::move(value))));
}

template <class Type>
auto Context::Unbox(Handle<JsValue> box) -> Type& {
	auto checked = As<JsBox<Type>>(box);
	return *static_cast<Type*>(binding.ExternalValue(Unwrap(checked))->Data());
}

template <class Type>
auto Context::Is(Handle<JsValue> value) -> bool {
	return Type::Is(binding, Unwrap(value));
}

template <class Type>
auto Context::As(Handle<JsValue> value) -> Handle<Type> {
	if (!Is<Type>(value)) {
		throw RuntimeTypeError{std::string{"Expected "} + Type::Name};
	}
	return value.template Cast<Type>();
}

template <class Type>
auto Context::Wrap(RawValue value) -> Handle<Type> {
	auto& scopes = env.Scopes();
	return {scopes.Top(), scopes.Root(value)};
}

template <class Fn>
void Context::RunScript(Fn fn) {
	bool ok;
	{
		Environment::Suspend suspend{env};
		ok = fn();
	}
	if (!ok) {
		throw RuntimeError{};
	}
}

template <class Fn, class Catch>
auto CallContext::TryCatch(Fn fn, Catch on_error) -> decltype(fn()) {
	using Result = decltype(fn());
	if constexpr (std::is_void<Result>::value) {
		auto error = CaptureFailure([&]() { fn(); });
		if (!error.IsEmpty()) {
			on_error(error);
		}
	} else {
		std::optional<Result> result;
		auto error = CaptureFailure([&]() { result.emplace(fn()); });
		if (!error.IsEmpty()) {
			return on_error(error);
		}
		return std::move(*result);
	}
}

template <class Type>
auto FunctionContext::Argument(size_t index) -> Handle<Type> {
	auto value = Argument(index);
	if (!Is<Type>(value)) {
		throw RuntimeTypeError{"Argument " + std::to_string(index + 1) + " must be a " + Type::Name};
	}
	return value.template Cast<Type>();
}

} // namespace tether
