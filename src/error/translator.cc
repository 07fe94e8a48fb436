#include "translator.h"
#include "error.h"
#include "context/context.h"
#include "lib/log.h"

namespace tether {
namespace ErrorTranslator {
namespace {

constexpr auto kUnknownMessage = "An exception was thrown. Sorry I don't know more.";

void ClearPending(EngineBinding& binding) {
	if (binding.IsExceptionPending()) {
		binding.TakeException();
	}
}

// Reads a string property, or returns false if it's missing or not a string
auto ReadString(EngineBinding& binding, RawValue object, const char* key, std::string& out) -> bool {
	RawValue value = nullptr;
	if (!binding.Get(object, key, value)) {
		ClearPending(binding);
		return false;
	}
	if (binding.TypeOf(value) != ValueType::String) {
		return false;
	}
	out = binding.StringValue(value);
	return true;
}

auto TypeFromName(const std::string& name) -> ErrorType {
	if (name == "TypeError") {
		return ErrorType::TypeError;
	} else if (name == "RangeError") {
		return ErrorType::RangeError;
	}
	return ErrorType::Error;
}

} // anonymous namespace

auto ToEngine(EngineBinding& binding, const ExternalError& error) noexcept -> RawValue {
	try {
		RawValue value = binding.NewError(error.Type(), error.Message());
		if (error.Name() != TypeName(error.Type())) {
			if (!binding.Set(value, "name", binding.NewString(error.Name()))) {
				ClearPending(binding);
			}
		}
		for (const auto& field : error.GetPayload()) {
			if (!binding.Set(value, field.first, binding.NewString(field.second))) {
				ClearPending(binding);
			}
		}
		return value;
	} catch (const std::exception& exception) {
		Log().error("Failed to build engine error \"{}\": {}", error.Describe(), exception.what());
		return nullptr;
	}
}

auto Internalize(Context& cx, const ExternalError& error) noexcept -> Handle<JsValue> {
	RawValue value = ToEngine(cx.Binding(), error);
	if (value == nullptr) {
		return {};
	}
	try {
		return cx.Wrap(value);
	} catch (const std::exception& exception) {
		Log().error("Failed to root engine error: {}", exception.what());
		return {};
	}
}

void Throw(EngineBinding& binding, const ExternalError& error) noexcept {
	ClearPending(binding);
	RawValue value = ToEngine(binding, error);
	if (value != nullptr) {
		binding.Throw(value);
	}
}

auto FromEngine(EngineBinding& binding, RawValue value) noexcept -> ExternalError {
	try {
		auto type = binding.TypeOf(value);
		if (type == ValueType::Object || type == ValueType::Function) {
			std::string message;
			std::string name;
			std::string code;
			bool has_message = ReadString(binding, value, "message", message);
			ReadString(binding, value, "name", name);
			if (has_message || binding.IsError(value)) {
				ReadString(binding, value, "code", code);
				ExternalError error{TypeFromName(name), message, KindFromName(code)};
				if (!name.empty() && name != TypeName(error.Type())) {
					error.WithName(name);
				}
				if (!code.empty()) {
					error.WithField("code", code);
				}
				return error;
			}
		}
		// Anything else thrown is reported by its string conversion
		std::string message;
		if (type == ValueType::String) {
			message = binding.StringValue(value);
		} else if (!binding.CoerceToString(value, message)) {
			ClearPending(binding);
			return ExternalError{ErrorType::Error, kUnknownMessage};
		}
		return ExternalError{ErrorType::Error, message};
	} catch (const std::exception& exception) {
		Log().error("Failed to read engine exception: {}", exception.what());
		return ExternalError{ErrorType::Error, kUnknownMessage};
	}
}

auto FromPendingException(Context& cx) noexcept -> ExternalError {
	auto& binding = cx.Binding();
	if (!binding.IsExceptionPending()) {
		return ExternalError{ErrorType::Error, kUnknownMessage};
	}
	RawValue exception = binding.TakeException();
	return FromEngine(binding, exception);
}

auto FromCurrentException() noexcept -> ExternalError {
	try {
		throw;
	} catch (const detail::RuntimeErrorConstructible& error) {
		return error.Externalize();
	} catch (const RuntimeError& error) {
		return ExternalError{ErrorType::Error, error.what()};
	} catch (const std::exception& error) {
		ExternalError aborted{ErrorType::Error, std::string{"Task work aborted: "} + error.what(), ErrorKind::TaskWorkAborted};
		aborted.WithField("code", KindName(ErrorKind::TaskWorkAborted));
		return aborted;
	} catch (...) {
		ExternalError aborted{ErrorType::Error, "Task work aborted: unknown exception", ErrorKind::TaskWorkAborted};
		aborted.WithField("code", KindName(ErrorKind::TaskWorkAborted));
		return aborted;
	}
}

auto FromCaughtException(Context& cx) noexcept -> ExternalError {
	try {
		throw;
	} catch (const detail::RuntimeErrorConstructible& error) {
		if (IsProgrammingError(error.Kind())) {
			Log().error("Denied: {}", error.GetMessage());
		}
		ClearPending(cx.Binding());
		return error.Externalize();
	} catch (const RuntimeError& error) {
		if (cx.Binding().IsExceptionPending()) {
			return FromPendingException(cx);
		}
		return ExternalError{ErrorType::Error, error.what()};
	} catch (const std::exception& error) {
		ClearPending(cx.Binding());
		return ExternalError{ErrorType::Error, error.what()};
	} catch (...) {
		ClearPending(cx.Binding());
		return ExternalError{ErrorType::Error, "Native code threw a non-standard exception"};
	}
}

auto CaughtToEngine(Context& cx) noexcept -> Handle<JsValue> {
	try {
		throw;
	} catch (const detail::RuntimeErrorConstructible& error) {
		if (IsProgrammingError(error.Kind())) {
			Log().error("Denied: {}", error.GetMessage());
		}
		ClearPending(cx.Binding());
		return Internalize(cx, error.Externalize());
	} catch (const RuntimeError& error) {
		auto& binding = cx.Binding();
		if (binding.IsExceptionPending()) {
			// Keep the engine's own exception object
			RawValue exception = binding.TakeException();
			try {
				return cx.Wrap(exception);
			} catch (const std::exception& wrap_error) {
				Log().error("Failed to root engine exception: {}", wrap_error.what());
				return {};
			}
		}
		return Internalize(cx, ExternalError{ErrorType::Error, error.what()});
	} catch (const std::exception& error) {
		ClearPending(cx.Binding());
		return Internalize(cx, ExternalError{ErrorType::Error, error.what()});
	} catch (...) {
		ClearPending(cx.Binding());
		return Internalize(cx, ExternalError{ErrorType::Error, "Native code threw a non-standard exception"});
	}
}

} // namespace ErrorTranslator
} // namespace tether
