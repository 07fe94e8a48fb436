#pragma once
#include "engine/environment.h"
#include "error/error.h"
#include "error/translator.h"
#include "lib/log.h"
#include <exception>

namespace tether {
namespace detail {

void ReportBarrierError(Environment& env, const ExternalError& error);

/**
 * Runs native code invoked by the engine and catches everything on the way out. An engine exception
 * which is already pending stays put; native errors are turned into engine exceptions. Returns
 * false if an exception is pending afterwards.
 */
template <class Fn>
auto RunBarrier(Environment& env, Fn fn) -> bool {
	try {
		fn();
		return true;
	} catch (const RuntimeErrorConstructible& error) {
		ReportBarrierError(env, error.Externalize());
	} catch (const FatalRuntimeError& error) {
		Log().critical("Fatal error in native code: {}", error.GetMessage());
		ReportBarrierError(env, ExternalError{ErrorType::Error, error.GetMessage()});
	} catch (const RuntimeError&) {
		if (env.OnEngineThread() && !env.Binding().IsExceptionPending()) {
			ReportBarrierError(env, ExternalError{ErrorType::Error, "Native code reported a pending exception, but none was thrown"});
		}
	} catch (const std::exception& error) {
		ReportBarrierError(env, ExternalError{ErrorType::Error, error.what()});
	} catch (...) {
		ReportBarrierError(env, ExternalError{ErrorType::Error, "Native code threw a non-standard exception"});
	}
	return env.OnEngineThread() ? !env.Binding().IsExceptionPending() : false;
}

} // namespace detail
} // namespace tether
