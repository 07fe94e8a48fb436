#pragma once
#include "external_error.h"
#include <exception>
#include <string>
#include <utility>

namespace tether {

/**
 * Native + engine exceptions, use with care
 */

// `RuntimeError` is thrown when the engine already has an exception on deck. It is the "exception
// pending" sentinel: whoever catches it must not touch the heap until the exception is handled or
// the call frame returns.
class RuntimeError : public std::exception {
	public:
		auto what() const noexcept -> const char* override {
			return "An engine exception is pending";
		}
};

namespace detail {

// `RuntimeErrorWithMessage` is a general error that has an error message with it
class RuntimeErrorWithMessage : public RuntimeError {
	public:
		explicit RuntimeErrorWithMessage(std::string message) : message{std::move(message)} {}

		auto GetMessage() const -> const std::string& {
			return message;
		}

		auto what() const noexcept -> const char* override {
			return message.c_str();
		}

	private:
		std::string message;
};

// `RuntimeErrorConstructible` is an abstract error that can be imported back into the engine
class RuntimeErrorConstructible : public RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
	public:
		virtual auto Externalize() const -> ExternalError = 0;
		virtual auto Kind() const -> ErrorKind { return ErrorKind::None; }
};

// `RuntimeErrorWithType` can be used to construct any of the engine's basic error types
template <ErrorType Type>
class RuntimeErrorWithType : public RuntimeErrorConstructible {
	using RuntimeErrorConstructible::RuntimeErrorConstructible;
	public:
		auto Externalize() const -> ExternalError final {
			return ExternalError{Type, GetMessage()};
		}
};

// `RuntimeErrorWithKind` is one of the failure conditions raised by this library
template <ErrorKind KindValue, ErrorType Type = ErrorType::Error>
class RuntimeErrorWithKind : public RuntimeErrorConstructible {
	using RuntimeErrorConstructible::RuntimeErrorConstructible;
	public:
		auto Externalize() const -> ExternalError final {
			ExternalError error{Type, GetMessage(), KindValue};
			error.WithField("code", KindName(KindValue));
			return error;
		}

		auto Kind() const -> ErrorKind final {
			return KindValue;
		}
};

} // namespace detail

// `FatalRuntimeError` is for very bad situations when the environment is now in an unknown state
class FatalRuntimeError : public detail::RuntimeErrorWithMessage {
	using RuntimeErrorWithMessage::RuntimeErrorWithMessage;
};

// These correspond to the given engine error types
using RuntimeGenericError = detail::RuntimeErrorWithType<ErrorType::Error>;
using RuntimeTypeError = detail::RuntimeErrorWithType<ErrorType::TypeError>;
using RuntimeRangeError = detail::RuntimeErrorWithType<ErrorType::RangeError>;

// Programming errors
using HandleEscapedScopeError = detail::RuntimeErrorWithKind<ErrorKind::HandleEscapedScope>;
using ContextReentrancyError = detail::RuntimeErrorWithKind<ErrorKind::ContextReentrancy>;
using PendingExceptionViolationError = detail::RuntimeErrorWithKind<ErrorKind::PendingExceptionViolation>;

// Recoverable errors
using ChannelClosedError = detail::RuntimeErrorWithKind<ErrorKind::ChannelClosed>;
using TaskWorkAbortedError = detail::RuntimeErrorWithKind<ErrorKind::TaskWorkAborted>;
using DeferredAlreadySettledError = detail::RuntimeErrorWithKind<ErrorKind::DeferredAlreadySettled>;
using TimeoutError = detail::RuntimeErrorWithKind<ErrorKind::Timeout>;
using UnsupportedCapabilityError = detail::RuntimeErrorWithKind<ErrorKind::UnsupportedCapability>;

/**
 * Carries an `ExternalError` produced elsewhere (another thread, or a previous engine exception)
 * so it can be thrown again through ordinary control flow.
 */
class RuntimeExternalError : public detail::RuntimeErrorConstructible {
	public:
		explicit RuntimeExternalError(ExternalError error) :
			RuntimeErrorConstructible{error.Message()}, error{std::move(error)} {}

		auto Externalize() const -> ExternalError final { return error; }
		auto Kind() const -> ErrorKind final { return error.Kind(); }
		auto GetError() const -> const ExternalError& { return error; }

	private:
		ExternalError error;
};

} // namespace tether
