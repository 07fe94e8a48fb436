#include "external_error.h"
#include <utility>

namespace tether {

auto KindName(ErrorKind kind) -> const char* {
	switch (kind) {
		case ErrorKind::None: return "None";
		case ErrorKind::HandleEscapedScope: return "HandleEscapedScope";
		case ErrorKind::ContextReentrancy: return "ContextReentrancy";
		case ErrorKind::ChannelClosed: return "ChannelClosed";
		case ErrorKind::TaskWorkAborted: return "TaskWorkAborted";
		case ErrorKind::DeferredAlreadySettled: return "DeferredAlreadySettled";
		case ErrorKind::PendingExceptionViolation: return "PendingExceptionViolation";
		case ErrorKind::UnsupportedCapability: return "UnsupportedCapability";
		case ErrorKind::Timeout: return "Timeout";
	}
	return "Unknown";
}

auto KindFromName(const std::string& name) -> ErrorKind {
	for (auto kind : {
		ErrorKind::HandleEscapedScope,
		ErrorKind::ContextReentrancy,
		ErrorKind::ChannelClosed,
		ErrorKind::TaskWorkAborted,
		ErrorKind::DeferredAlreadySettled,
		ErrorKind::PendingExceptionViolation,
		ErrorKind::UnsupportedCapability,
		ErrorKind::Timeout,
	}) {
		if (name == KindName(kind)) {
			return kind;
		}
	}
	return ErrorKind::None;
}

auto TypeName(ErrorType type) -> const char* {
	switch (type) {
		case ErrorType::Error: return "Error";
		case ErrorType::TypeError: return "TypeError";
		case ErrorType::RangeError: return "RangeError";
	}
	return "Error";
}

auto IsProgrammingError(ErrorKind kind) -> bool {
	return
		kind == ErrorKind::HandleEscapedScope ||
		kind == ErrorKind::ContextReentrancy ||
		kind == ErrorKind::PendingExceptionViolation;
}

ExternalError::ExternalError(ErrorType type, std::string message, ErrorKind kind) :
	type{type}, kind{kind}, message{std::move(message)} {}

auto ExternalError::Name() const -> std::string {
	return name.empty() ? TypeName(type) : name;
}

auto ExternalError::WithName(std::string name) -> ExternalError& {
	this->name = std::move(name);
	return *this;
}

auto ExternalError::WithField(const std::string& key, std::string value) -> ExternalError& {
	payload[key] = std::move(value);
	return *this;
}

auto ExternalError::Describe() const -> std::string {
	if (message.empty()) {
		return Name();
	}
	return Name() + ": " + message;
}

} // namespace tether
