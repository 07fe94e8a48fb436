#include "context.h"
#include "error/translator.h"

namespace tether {

/**
 * Context implementation
 */
Context::Context(Environment& env) : env{env}, binding{env.Binding()} {
	env.Enter(this);
	scope = env.Scopes().Push();
}

Context::~Context() {
	env.Scopes().Pop(scope);
	env.Leave(this);
}

void Context::Check() {
	if (!env.OnEngineThread()) {
		throw ContextReentrancyError{"Engine operations are only allowed on the engine thread"};
	}
	if (env.ActiveContext() != this) {
		throw ContextReentrancyError{"Context used while another context is active"};
	}
	if (binding.IsExceptionPending()) {
		throw PendingExceptionViolationError{"Engine operation attempted while an exception is pending"};
	}
}

auto Context::Undefined() -> Handle<JsUndefined> {
	Check();
	return Wrap<JsUndefined>(binding.NewUndefined());
}

auto Context::Null() -> Handle<JsNull> {
	Check();
	return Wrap<JsNull>(binding.NewNull());
}

auto Context::Boolean(bool value) -> Handle<JsBoolean> {
	Check();
	return Wrap<JsBoolean>(binding.NewBoolean(value));
}

auto Context::Number(double value) -> Handle<JsNumber> {
	Check();
	return Wrap<JsNumber>(binding.NewNumber(value));
}

auto Context::String(const std::string& value) -> Handle<JsString> {
	Check();
	return Wrap<JsString>(binding.NewString(value));
}

auto Context::BigInt(int64_t value) -> Handle<JsBigInt> {
	Check();
	RequireTier(ActiveTier(), kTierBigInt, "BigInt");
	return Wrap<JsBigInt>(binding.NewBigInt(value));
}

auto Context::Object() -> Handle<JsObject> {
	Check();
	return Wrap<JsObject>(binding.NewObject());
}

auto Context::Array(uint32_t length) -> Handle<JsArray> {
	Check();
	return Wrap<JsArray>(binding.NewArray(length));
}

auto Context::Error(const std::string& message, ErrorType type) -> Handle<JsError> {
	Check();
	return Wrap<JsError>(binding.NewError(type, message));
}

auto Context::Function(const std::string& name, NativeFunction function) -> Handle<JsFunction> {
	Check();
	RawValue result = nullptr;
	if (!binding.NewFunction(name, env.MakeFunctionEntry(std::move(function)), result)) {
		throw RuntimeError{};
	}
	return Wrap<JsFunction>(result);
}

auto Context::Global() -> Handle<JsObject> {
	Check();
	return Wrap<JsObject>(binding.Global());
}

auto Context::TypeOf(Handle<JsValue> value) -> ValueType {
	return binding.TypeOf(Unwrap(value));
}

auto Context::BooleanValue(Handle<JsBoolean> value) -> bool {
	return binding.BooleanValue(Unwrap(value));
}

auto Context::NumberValue(Handle<JsNumber> value) -> double {
	return binding.NumberValue(Unwrap(value));
}

auto Context::StringValue(Handle<JsString> value) -> std::string {
	return binding.StringValue(Unwrap(value));
}

auto Context::BigIntValue(Handle<JsBigInt> value, bool* lossless) -> int64_t {
	RequireTier(ActiveTier(), kTierBigInt, "BigInt");
	bool ignored = true;
	return binding.BigIntValue(Unwrap(value), lossless == nullptr ? ignored : *lossless);
}

auto Context::Length(Handle<JsArray> array) -> uint32_t {
	return binding.ArrayLength(Unwrap(array));
}

auto Context::StrictEquals(Handle<JsValue> left, Handle<JsValue> right) -> bool {
	return binding.StrictEquals(Unwrap(left), Unwrap(right));
}

auto Context::ToString(Handle<JsValue> value) -> std::string {
	RawValue raw = Unwrap(value);
	std::string result;
	RunScript([&]() { return binding.CoerceToString(raw, result); });
	return result;
}

auto Context::Get(Handle<JsObject> object, const std::string& key) -> Handle<JsValue> {
	RawValue raw = Unwrap(object);
	RawValue result = nullptr;
	RunScript([&]() { return binding.Get(raw, key, result); });
	return Wrap(result);
}

auto Context::Get(Handle<JsObject> object, uint32_t index) -> Handle<JsValue> {
	RawValue raw = Unwrap(object);
	RawValue result = nullptr;
	RunScript([&]() { return binding.GetIndex(raw, index, result); });
	return Wrap(result);
}

void Context::Set(Handle<JsObject> object, const std::string& key, Handle<JsValue> value) {
	RawValue raw = Unwrap(object);
	RawValue raw_value = Unwrap(value);
	RunScript([&]() { return binding.Set(raw, key, raw_value); });
}

void Context::Set(Handle<JsObject> object, uint32_t index, Handle<JsValue> value) {
	RawValue raw = Unwrap(object);
	RawValue raw_value = Unwrap(value);
	RunScript([&]() { return binding.SetIndex(raw, index, raw_value); });
}

auto Context::Delete(Handle<JsObject> object, const std::string& key) -> bool {
	RawValue raw = Unwrap(object);
	bool deleted = false;
	RunScript([&]() { return binding.Delete(raw, key, deleted); });
	return deleted;
}

auto Context::Call(
	Handle<JsFunction> function,
	Handle<JsValue> receiver,
	const std::vector<Handle<JsValue>>& arguments
) -> Handle<JsValue> {
	RawValue raw_function = Unwrap(function);
	RawValue raw_receiver = receiver.IsEmpty() ? binding.NewUndefined() : Unwrap(receiver);
	std::vector<RawValue> argv;
	argv.reserve(arguments.size());
	for (auto argument : arguments) {
		argv.push_back(Unwrap(argument));
	}
	RawValue result = nullptr;
	RunScript([&]() { return binding.Call(raw_function, raw_receiver, argv, result); });
	return Wrap(result);
}

auto Context::Unwrap(Handle<JsValue> value) -> RawValue {
	Check();
	return env.Scopes().Resolve(value.Scope(), value.Slot());
}

/**
 * CallContext implementation
 */
auto CallContext::Throw(Handle<JsValue> error) -> RuntimeError {
	binding.Throw(Unwrap(error));
	return RuntimeError{};
}

auto CallContext::ThrowError(const std::string& message, ErrorType type) -> RuntimeError {
	return Throw(Error(message, type));
}

auto CallContext::CaptureFailure(const std::function<void()>& fn) -> Handle<JsValue> {
	Check();
	try {
		fn();
		return {};
	} catch (const detail::RuntimeErrorConstructible& error) {
		if (IsProgrammingError(error.Kind())) {
			throw;
		}
		if (binding.IsExceptionPending()) {
			// Replaced by the native error
			binding.TakeException();
		}
		return Wrap(ErrorTranslator::ToEngine(binding, error.Externalize()));
	} catch (const FatalRuntimeError&) {
		throw;
	} catch (const RuntimeError&) {
		if (!binding.IsExceptionPending()) {
			throw;
		}
		return Wrap(binding.TakeException());
	}
}

/**
 * FunctionContext implementation
 */
auto FunctionContext::Argument(size_t index) -> Handle<JsValue> {
	Check();
	if (index >= args.arguments.size()) {
		return Undefined();
	}
	return Wrap(args.arguments[index]);
}

auto FunctionContext::This() -> Handle<JsValue> {
	Check();
	return Wrap(args.this_value);
}

auto FunctionContext::Return(Handle<JsValue> value) -> RawValue {
	if (value.IsEmpty()) {
		value = Undefined();
	}
	Unwrap(value);
	if (value.Scope() == GetScope()) {
		return env.Scopes().EscapeToEngine(GetScope(), value.Slot());
	}
	// Rooted in an enclosing frame, which the engine still holds
	return Unwrap(value);
}

/**
 * ModuleContext implementation
 */
auto ModuleContext::Exports() -> Handle<JsObject> {
	Check();
	return Wrap<JsObject>(exports);
}

void ModuleContext::Export(const std::string& name, Handle<JsValue> value) {
	Set(Exports(), name, value);
}

void ModuleContext::ExportFunction(const std::string& name, NativeFunction function) {
	Export(name, Function(name, std::move(function)));
}

} // namespace tether
