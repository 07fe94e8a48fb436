#pragma once
#include "handle.h"
#include "scope_stack.h"
#include "error/error.h"

namespace tether {

class Context;

/**
 * A nested region of the current Context. While a `Scope` is the innermost one, every handle the
 * Context creates is rooted in it, and all of them become invalid when it closes. `Escape` moves
 * one value into the immediate parent so it can be returned.
 */
class Scope {
	public:
		explicit Scope(Context& cx);
		Scope(const Scope&) = delete;
		~Scope() { Close(); }
		auto operator=(const Scope&) = delete;

		auto Id() const -> ScopeId { return id; }
		auto Parent() const -> ScopeId { return parent; }
		auto IsOpen() const -> bool { return open && stack.IsOpen(id); }

		// Roots a raw engine value in this scope
		template <class Type = JsValue>
		auto HandleFor(RawValue value) -> Handle<Type>;

		// Re-roots one of this scope's own handles into the immediate parent. Only once per scope.
		template <class Type>
		auto Escape(Handle<Type> handle) -> Handle<Type>;

		// Same as `Escape`, but fails unless `target` is the immediate parent
		template <class Type>
		auto EscapeTo(ScopeId target, Handle<Type> handle) -> Handle<Type>;

		void Close();

	private:
		ScopeStack& stack;
		ScopeId id;
		ScopeId parent;
		bool open = true;
};

template <class Type>
auto Scope::HandleFor(RawValue value) -> Handle<Type> {
	if (stack.Top() != id) {
		throw HandleEscapedScopeError{"Values may only be rooted in the innermost open scope"};
	}
	return {id, stack.Root(value)};
}

template <class Type>
auto Scope::Escape(Handle<Type> handle) -> Handle<Type> {
	if (!IsOpen()) {
		throw HandleEscapedScopeError{"Scope is already closed"};
	}
	if (handle.Scope() != id) {
		throw HandleEscapedScopeError{"Only a scope's own handles can be escaped"};
	}
	return {parent, stack.Escape(id, handle.Slot())};
}

template <class Type>
auto Scope::EscapeTo(ScopeId target, Handle<Type> handle) -> Handle<Type> {
	if (target != parent) {
		throw HandleEscapedScopeError{"A handle can only escape into the immediate parent scope"};
	}
	return Escape(handle);
}

} // namespace tether
