#include "v8_binding.h"
#include "config.h"
#include "environment.h"
#include "error/error.h"
#include "error/translator.h"
#include "lib/log.h"
#include <cstring>
#include <utility>

using namespace v8;

namespace tether {
namespace {

static_assert(sizeof(Local<Value>) == sizeof(RawValue), "v8::Local must fit in a RawValue");

auto ToLocal(RawValue value) -> Local<Value> {
	Local<Value> local;
	std::memcpy(static_cast<void*>(&local), &value, sizeof(value));
	return local;
}

template <class Type>
auto ToLocal(RawValue value) -> Local<Type> {
	return ToLocal(value).As<Type>();
}

template <class Type>
auto FromLocal(Local<Type> local) -> RawValue {
	Local<Value> value = local;
	RawValue raw;
	std::memcpy(&raw, static_cast<void*>(&value), sizeof(raw));
	return raw;
}

// Everything a task-completion drain needs from the host
struct EscapableScopeRecord {
	explicit EscapableScopeRecord(Isolate* isolate) : scope{isolate} {}

	EscapableHandleScope scope;
};

struct CallbackRecord {
	CallbackRecord(Isolate* isolate, const v8::Global<v8::Context>& context) :
		handle_scope{isolate},
		context_scope{context.Get(isolate)},
		callback_scope{isolate, Object::New(isolate), {0, 0}} {}

	HandleScope handle_scope;
	v8::Context::Scope context_scope;
	node::CallbackScope callback_scope;
};

} // anonymous namespace

struct V8Binding::FunctionRecord {
	V8Binding* binding;
	std::unique_ptr<FunctionEntry> entry;
	v8::Global<Function> handle;
};

struct V8Binding::ExternalRecord {
	V8Binding* binding;
	std::unique_ptr<ExternalEntry> entry;
	v8::Global<Value> handle;
};

/**
 * V8Binding implementation
 */
template <class Fn>
auto V8Binding::Attempt(Fn fn) -> bool {
	TryCatch try_catch{isolate};
	if (fn()) {
		return true;
	}
	if (try_catch.HasCaught() && !try_catch.HasTerminated()) {
		pending.Reset(isolate, try_catch.Exception());
	} else {
		pending.Reset(isolate, Exception::Error(MakeString("Script execution was terminated")));
	}
	return false;
}

V8Binding::V8Binding(Isolate* isolate, Local<v8::Context> context) :
	isolate{isolate}, context{isolate, context} {}

V8Binding::~V8Binding() {
	// Nothing runs script past this point, so entries are destroyed without being finalized
	for (auto* record : externals) {
		record->handle.Reset();
		delete record;
	}
	for (auto* record : finalizers) {
		delete record;
	}
	for (auto* record : functions) {
		record->handle.Reset();
		delete record;
	}
	for (auto* record : collected_functions) {
		delete record;
	}
	if (finalizer_async != nullptr) {
		uv_close(reinterpret_cast<uv_handle_t*>(finalizer_async), [](uv_handle_t* handle) {
			delete reinterpret_cast<uv_async_t*>(handle);
		});
	}
}

void V8Binding::InitializeModule(
	Local<Object> exports,
	Local<v8::Context> context,
	const std::function<void(ModuleContext&)>& init
) {
	auto* isolate = context->GetIsolate();
	Environment* env = nullptr;
	try {
		env = new Environment{std::make_unique<V8Binding>(isolate, context), Config::FromEnvironment()};
	} catch (const detail::RuntimeErrorConstructible& error) {
		// The environment never came up, so this is the only place to report why
		Log().error("Module initialization failed: {}", error.GetMessage());
		V8Binding binding{isolate, context};
		ErrorTranslator::Throw(binding, error.Externalize());
		binding.RethrowPending();
		return;
	}
	node::AddEnvironmentCleanupHook(isolate, [](void* param) {
		delete static_cast<Environment*>(param);
	}, env);
	if (!env->InitModule(FromLocal(exports), init)) {
		static_cast<V8Binding&>(env->Binding()).RethrowPending();
	}
}

void V8Binding::RethrowPending() {
	if (!pending.IsEmpty()) {
		auto exception = pending.Get(isolate);
		pending.Reset();
		isolate->ThrowException(exception);
	}
}

auto V8Binding::Loop() -> uv_loop_s* {
	return node::GetCurrentEventLoop(isolate);
}

auto V8Binding::OpenScope() -> ScopeMarker {
	return reinterpret_cast<ScopeMarker>(new EscapableScopeRecord{isolate});
}

void V8Binding::CloseScope(ScopeMarker marker) {
	delete reinterpret_cast<EscapableScopeRecord*>(marker);
}

auto V8Binding::Escape(ScopeMarker marker, RawValue value) -> RawValue {
	return FromLocal(reinterpret_cast<EscapableScopeRecord*>(marker)->scope.Escape(ToLocal(value)));
}

auto V8Binding::OpenCallbackScope() -> CallbackMarker {
	return reinterpret_cast<CallbackMarker>(new CallbackRecord{isolate, context});
}

void V8Binding::CloseCallbackScope(CallbackMarker marker) {
	// node's callback scope holds a verbose TryCatch, throwing into it reports the exception as
	// uncaught
	RethrowPending();
	delete reinterpret_cast<CallbackRecord*>(marker);
}

auto V8Binding::NewUndefined() -> RawValue {
	return FromLocal(v8::Undefined(isolate));
}

auto V8Binding::NewNull() -> RawValue {
	return FromLocal(v8::Null(isolate));
}

auto V8Binding::NewBoolean(bool value) -> RawValue {
	return FromLocal(v8::Boolean::New(isolate, value));
}

auto V8Binding::NewNumber(double value) -> RawValue {
	return FromLocal(Number::New(isolate, value));
}

auto V8Binding::NewString(const std::string& value) -> RawValue {
	return FromLocal(MakeString(value));
}

auto V8Binding::NewBigInt(int64_t value) -> RawValue {
	return FromLocal(BigInt::New(isolate, value));
}

auto V8Binding::NewObject() -> RawValue {
	return FromLocal(Object::New(isolate));
}

auto V8Binding::NewArray(uint32_t length) -> RawValue {
	return FromLocal(Array::New(isolate, static_cast<int>(length)));
}

auto V8Binding::NewError(ErrorType type, const std::string& message) -> RawValue {
	auto string = MakeString(message);
	switch (type) {
		case ErrorType::TypeError:
			return FromLocal(Exception::TypeError(string));
		case ErrorType::RangeError:
			return FromLocal(Exception::RangeError(string));
		default:
			return FromLocal(Exception::Error(string));
	}
}

auto V8Binding::NewFunction(const std::string& name, std::unique_ptr<FunctionEntry> entry, RawValue& out) -> bool {
	StartFinalizers();
	auto record = std::make_unique<FunctionRecord>(FunctionRecord{this, std::move(entry), {}});
	bool ok = Attempt([&]() {
		Local<Function> function;
		if (!Function::New(CurrentContext(), FunctionCallback, External::New(isolate, record.get())).ToLocal(&function)) {
			return false;
		}
		function->SetName(MakeString(name));
		// The record lives exactly as long as the function
		record->handle.Reset(isolate, function);
		record->handle.SetWeak(record.get(), FunctionWeakCallback, WeakCallbackType::kParameter);
		out = FromLocal(function);
		return true;
	});
	if (ok) {
		functions.insert(record.release());
	}
	return ok;
}

auto V8Binding::NewExternal(std::unique_ptr<ExternalEntry> entry) -> RawValue {
	StartFinalizers();
	auto* record = new ExternalRecord{this, std::move(entry), {}};
	auto external = External::New(isolate, record);
	record->handle.Reset(isolate, external);
	record->handle.SetWeak(record, WeakCallback, WeakCallbackType::kParameter);
	externals.insert(record);
	return FromLocal(external);
}

auto V8Binding::Global() -> RawValue {
	return FromLocal(CurrentContext()->Global());
}

auto V8Binding::TypeOf(RawValue value) -> ValueType {
	auto local = ToLocal(value);
	if (local->IsUndefined()) {
		return ValueType::Undefined;
	} else if (local->IsNull()) {
		return ValueType::Null;
	} else if (local->IsBoolean()) {
		return ValueType::Boolean;
	} else if (local->IsNumber()) {
		return ValueType::Number;
	} else if (local->IsString()) {
		return ValueType::String;
	} else if (local->IsSymbol()) {
		return ValueType::Symbol;
	} else if (local->IsBigInt()) {
		return ValueType::BigInt;
	} else if (local->IsExternal()) {
		return ValueType::External;
	} else if (local->IsFunction()) {
		return ValueType::Function;
	}
	return ValueType::Object;
}

auto V8Binding::IsArray(RawValue value) -> bool {
	return ToLocal(value)->IsArray();
}

auto V8Binding::IsError(RawValue value) -> bool {
	return ToLocal(value)->IsNativeError();
}

auto V8Binding::IsPromise(RawValue value) -> bool {
	return ToLocal(value)->IsPromise();
}

auto V8Binding::BooleanValue(RawValue value) -> bool {
	return ToLocal(value)->BooleanValue(isolate);
}

auto V8Binding::NumberValue(RawValue value) -> double {
	return ToLocal<Number>(value)->Value();
}

auto V8Binding::StringValue(RawValue value) -> std::string {
	String::Utf8Value utf8{isolate, ToLocal(value)};
	return {*utf8, static_cast<size_t>(utf8.length())};
}

auto V8Binding::BigIntValue(RawValue value, bool& lossless) -> int64_t {
	return ToLocal<BigInt>(value)->Int64Value(&lossless);
}

auto V8Binding::ArrayLength(RawValue value) -> uint32_t {
	return ToLocal<Array>(value)->Length();
}

auto V8Binding::ExternalValue(RawValue value) -> ExternalEntry* {
	auto local = ToLocal(value);
	if (!local->IsExternal()) {
		return nullptr;
	}
	auto* record = static_cast<ExternalRecord*>(local.As<External>()->Value());
	return externals.count(record) == 0 ? nullptr : record->entry.get();
}

auto V8Binding::StrictEquals(RawValue left, RawValue right) -> bool {
	return ToLocal(left)->StrictEquals(ToLocal(right));
}

auto V8Binding::CoerceToString(RawValue value, std::string& out) -> bool {
	return Attempt([&]() {
		Local<String> string;
		if (!ToLocal(value)->ToString(CurrentContext()).ToLocal(&string)) {
			return false;
		}
		out = StringValue(FromLocal(string));
		return true;
	});
}

auto V8Binding::Get(RawValue object, const std::string& key, RawValue& out) -> bool {
	return Attempt([&]() {
		Local<Value> result;
		if (!ToLocal<Object>(object)->Get(CurrentContext(), MakeString(key)).ToLocal(&result)) {
			return false;
		}
		out = FromLocal(result);
		return true;
	});
}

auto V8Binding::Set(RawValue object, const std::string& key, RawValue value) -> bool {
	return Attempt([&]() {
		return ToLocal<Object>(object)->Set(CurrentContext(), MakeString(key), ToLocal(value)).IsJust();
	});
}

auto V8Binding::Delete(RawValue object, const std::string& key, bool& deleted) -> bool {
	return Attempt([&]() {
		return ToLocal<Object>(object)->Delete(CurrentContext(), MakeString(key)).To(&deleted);
	});
}

auto V8Binding::GetIndex(RawValue object, uint32_t index, RawValue& out) -> bool {
	return Attempt([&]() {
		Local<Value> result;
		if (!ToLocal<Object>(object)->Get(CurrentContext(), index).ToLocal(&result)) {
			return false;
		}
		out = FromLocal(result);
		return true;
	});
}

auto V8Binding::SetIndex(RawValue object, uint32_t index, RawValue value) -> bool {
	return Attempt([&]() {
		return ToLocal<Object>(object)->Set(CurrentContext(), index, ToLocal(value)).IsJust();
	});
}

auto V8Binding::Call(RawValue function, RawValue receiver, const std::vector<RawValue>& argv, RawValue& out) -> bool {
	std::vector<Local<Value>> arguments;
	arguments.reserve(argv.size());
	for (auto value : argv) {
		arguments.push_back(ToLocal(value));
	}
	return Attempt([&]() {
		Local<Value> result;
		auto maybe_result = ToLocal<Function>(function)->Call(
			CurrentContext(),
			ToLocal(receiver),
			static_cast<int>(arguments.size()),
			arguments.empty() ? nullptr : arguments.data()
		);
		if (!maybe_result.ToLocal(&result)) {
			return false;
		}
		out = FromLocal(result);
		return true;
	});
}

void V8Binding::Throw(RawValue value) {
	pending.Reset(isolate, ToLocal(value));
}

auto V8Binding::IsExceptionPending() -> bool {
	return !pending.IsEmpty();
}

auto V8Binding::TakeException() -> RawValue {
	if (pending.IsEmpty()) {
		return NewUndefined();
	}
	auto exception = pending.Get(isolate);
	pending.Reset();
	return FromLocal(exception);
}

auto V8Binding::NewPromise(RawValue& resolver) -> RawValue {
	auto local = Promise::Resolver::New(CurrentContext()).ToLocalChecked();
	resolver = FromLocal(local);
	return FromLocal(local->GetPromise());
}

auto V8Binding::Resolve(RawValue resolver, RawValue value) -> bool {
	return Attempt([&]() {
		return ToLocal<Promise::Resolver>(resolver)->Resolve(CurrentContext(), ToLocal(value)).IsJust();
	});
}

auto V8Binding::Reject(RawValue resolver, RawValue value) -> bool {
	return Attempt([&]() {
		return ToLocal<Promise::Resolver>(resolver)->Reject(CurrentContext(), ToLocal(value)).IsJust();
	});
}

auto V8Binding::Reference(RawValue value) -> RawReference {
	return reinterpret_cast<RawReference>(new v8::Global<Value>{isolate, ToLocal(value)});
}

auto V8Binding::Dereference(RawReference reference) -> RawValue {
	return FromLocal(reinterpret_cast<v8::Global<Value>*>(reference)->Get(isolate));
}

void V8Binding::Release(RawReference reference) {
	delete reinterpret_cast<v8::Global<Value>*>(reference);
}

void V8Binding::FunctionCallback(const FunctionCallbackInfo<Value>& info) {
	auto* record = static_cast<FunctionRecord*>(info.Data().As<External>()->Value());
	auto& binding = *record->binding;
	CallbackArgs args;
	args.this_value = FromLocal(info.This());
	args.arguments.reserve(info.Length());
	for (int ii = 0; ii < info.Length(); ++ii) {
		args.arguments.push_back(FromLocal(info[ii]));
	}
	if (record->entry->Invoke(args)) {
		info.GetReturnValue().Set(ToLocal(args.result));
	} else {
		binding.RethrowPending();
	}
}

void V8Binding::WeakCallback(const WeakCallbackInfo<ExternalRecord>& info) {
	// Inside GC nothing may touch the heap, the entry is finalized later from the event loop
	auto* record = info.GetParameter();
	auto& binding = *record->binding;
	record->handle.Reset();
	binding.externals.erase(record);
	binding.finalizers.push_back(record);
	uv_async_send(binding.finalizer_async);
}

void V8Binding::FunctionWeakCallback(const WeakCallbackInfo<FunctionRecord>& info) {
	// The entry may own anything, so it is destroyed from the event loop rather than inside GC
	auto* record = info.GetParameter();
	auto& binding = *record->binding;
	record->handle.Reset();
	binding.functions.erase(record);
	binding.collected_functions.push_back(record);
	uv_async_send(binding.finalizer_async);
}

void V8Binding::StartFinalizers() {
	if (finalizer_async != nullptr) {
		return;
	}
	finalizer_async = new uv_async_t;
	uv_async_init(Loop(), finalizer_async, [](uv_async_t* async) {
		static_cast<V8Binding*>(async->data)->RunFinalizers();
	});
	finalizer_async->data = this;
	uv_unref(reinterpret_cast<uv_handle_t*>(finalizer_async));
}

void V8Binding::RunFinalizers() {
	for (auto* record : std::exchange(collected_functions, {})) {
		delete record;
	}
	auto records = std::exchange(finalizers, {});
	for (auto* record : records) {
		{
			HandleScope handle_scope{isolate};
			v8::Context::Scope context_scope{context.Get(isolate)};
			record->entry->Finalize();
		}
		delete record;
	}
}

auto V8Binding::CurrentContext() -> Local<v8::Context> {
	return context.Get(isolate);
}

auto V8Binding::MakeString(const std::string& value) -> Local<String> {
	return String::NewFromUtf8(isolate, value.data(), NewStringType::kNormal, static_cast<int>(value.size()))
		.ToLocalChecked();
}

} // namespace tether
