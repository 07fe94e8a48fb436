#include "root.h"
#include "context/context.h"
#include <utility>

namespace tether {
namespace detail {

RootBase::RootBase(Context& cx, Handle<JsValue> handle) :
		reference{cx.Binding().Reference(cx.Unwrap(handle))},
		releases{cx.GetEnvironment().Releases()} {}

RootBase::RootBase(RootBase&& that) noexcept :
	reference{std::exchange(that.reference, nullptr)}, releases{std::move(that.releases)} {}

RootBase::~RootBase() {
	Release();
}

auto RootBase::operator=(RootBase&& that) noexcept -> RootBase& {
	if (this != &that) {
		Release();
		reference = std::exchange(that.reference, nullptr);
		releases = std::move(that.releases);
	}
	return *this;
}

void RootBase::Drop(Context& cx) {
	if (reference != nullptr) {
		cx.Check();
		cx.Binding().Release(std::exchange(reference, nullptr));
		releases.reset();
	}
}

auto RootBase::Deref(Context& cx) const -> Handle<JsValue> {
	cx.Check();
	if (reference == nullptr) {
		throw RuntimeGenericError{"Root has already been dropped"};
	}
	return cx.Wrap(cx.Binding().Dereference(reference));
}

auto RootBase::Clone(Context& cx) const -> RootBase {
	return RootBase{cx, Deref(cx)};
}

void RootBase::Release() {
	if (reference != nullptr) {
		releases->Push(std::exchange(reference, nullptr));
		releases.reset();
	}
}

} // namespace detail
} // namespace tether
