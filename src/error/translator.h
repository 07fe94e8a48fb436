#pragma once
#include "external_error.h"
#include "engine/binding.h"
#include "scope/handle.h"

namespace tether {

class Context;

/**
 * Conversions between native errors and engine exceptions. None of these throw. A conversion that
 * fails falls back to a generic error (engine -> native) or an empty result (native -> engine), and
 * any exception raised by the engine along the way is cleared.
 */
namespace ErrorTranslator {

// Native -> engine
auto ToEngine(EngineBinding& binding, const ExternalError& error) noexcept -> RawValue;
auto Internalize(Context& cx, const ExternalError& error) noexcept -> Handle<JsValue>;
// Builds `error` and places it in the pending-exception slot, replacing whatever was there
void Throw(EngineBinding& binding, const ExternalError& error) noexcept;

// Engine -> native
auto FromEngine(EngineBinding& binding, RawValue value) noexcept -> ExternalError;
// Takes the pending exception out of the engine
auto FromPendingException(Context& cx) noexcept -> ExternalError;

// These must be called from inside a `catch` block. `FromCurrentException` has no Context, so an
// exception that isn't one of ours is reported as aborted task work.
auto FromCurrentException() noexcept -> ExternalError;
// Same as above, but a pending engine exception is taken and read
auto FromCaughtException(Context& cx) noexcept -> ExternalError;
auto CaughtToEngine(Context& cx) noexcept -> Handle<JsValue>;

} // namespace ErrorTranslator
} // namespace tether
