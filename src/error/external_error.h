#pragma once
#include <map>
#include <string>

namespace tether {

/**
 * Failure conditions this library reports on its own behalf. `None` is used for ordinary errors
 * raised by native code or by script.
 */
enum class ErrorKind {
	None,
	HandleEscapedScope,
	ContextReentrancy,
	ChannelClosed,
	TaskWorkAborted,
	DeferredAlreadySettled,
	PendingExceptionViolation,
	UnsupportedCapability,
	Timeout,
};

// Engine error constructor to use when the error is brought into the engine
enum class ErrorType { Error, TypeError, RangeError };

auto KindName(ErrorKind kind) -> const char*;
auto TypeName(ErrorType type) -> const char*;
// Inverse of `KindName`. Unknown names are `None`.
auto KindFromName(const std::string& name) -> ErrorKind;

// Misuse of the library itself. These are denied where they happen and logged loudly.
auto IsProgrammingError(ErrorKind kind) -> bool;

/**
 * Handle-free copy of an error. It can cross threads, sit in a queue, and be turned back into an
 * engine exception later by the translator.
 */
class ExternalError {
	public:
		using Payload = std::map<std::string, std::string>;

		ExternalError() = default;
		ExternalError(ErrorType type, std::string message, ErrorKind kind = ErrorKind::None);

		auto Type() const -> ErrorType { return type; }
		auto Kind() const -> ErrorKind { return kind; }
		auto Message() const -> const std::string& { return message; }
		auto Name() const -> std::string;
		auto GetPayload() const -> const Payload& { return payload; }

		// Overrides the `name` reported by the engine exception (default is the constructor name)
		auto WithName(std::string name) -> ExternalError&;
		// Adds a string property to the engine exception
		auto WithField(const std::string& key, std::string value) -> ExternalError&;

		// "TypeError: message"
		auto Describe() const -> std::string;

	private:
		ErrorType type = ErrorType::Error;
		ErrorKind kind = ErrorKind::None;
		std::string name;
		std::string message;
		Payload payload;
};

} // namespace tether
