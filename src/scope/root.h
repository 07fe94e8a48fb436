#pragma once
#include "handle.h"
#include <memory>

namespace tether {

class Context;
namespace detail {
class ReleaseQueue;

// Untyped part of `Root`
class RootBase {
	public:
		RootBase() = default;
		RootBase(Context& cx, Handle<JsValue> handle);
		RootBase(const RootBase&) = delete;
		RootBase(RootBase&& that) noexcept;
		~RootBase();
		auto operator=(const RootBase&) = delete;
		auto operator=(RootBase&& that) noexcept -> RootBase&;

		auto IsEmpty() const -> bool { return reference == nullptr; }
		void Drop(Context& cx);

	protected:
		auto Deref(Context& cx) const -> Handle<JsValue>;
		auto Clone(Context& cx) const -> RootBase;

	private:
		void Release();

		RawReference reference = nullptr;
		std::shared_ptr<ReleaseQueue> releases;
};

} // namespace detail

/**
 * A persistent reference to an engine value which outlives any Scope. A Root can be moved to and
 * dropped on any thread, but only dereferenced on the engine thread. Dropping it without a Context
 * queues the release, which happens the next time a Context is entered.
 */
template <class Type>
class Root : public detail::RootBase {
	public:
		Root() = default;
		Root(Context& cx, Handle<Type> handle) : RootBase{cx, handle} {}

		// A new handle in the current scope
		auto Into(Context& cx) const -> Handle<Type> {
			return Deref(cx).template Cast<Type>();
		}

		auto Clone(Context& cx) const -> Root {
			return Root{RootBase::Clone(cx)};
		}

	private:
		explicit Root(RootBase base) : RootBase{std::move(base)} {}
};

} // namespace tether
