#include "scope_stack.h"
#include "error/error.h"
#include <algorithm>

namespace tether {

ScopeStack::~ScopeStack() {
	while (!frames.empty()) {
		binding.CloseScope(frames.back().marker);
		frames.pop_back();
	}
}

auto ScopeStack::Push() -> ScopeId {
	ScopeId id = next_id++;
	frames.push_back(Frame{id, binding.OpenScope(), {}, false});
	return id;
}

void ScopeStack::Pop(ScopeId id) {
	// Anything opened above `id` is closed with it. Under RAII scopes this never happens, but the
	// engine's marker stack must not be left out of step.
	while (!frames.empty()) {
		ScopeId top = frames.back().id;
		if (top < id) {
			break;
		}
		binding.CloseScope(frames.back().marker);
		frames.pop_back();
		if (top == id) {
			break;
		}
	}
}

auto ScopeStack::Top() const -> ScopeId {
	return frames.empty() ? 0 : frames.back().id;
}

auto ScopeStack::Parent(ScopeId id) const -> ScopeId {
	auto ii = std::lower_bound(frames.begin(), frames.end(), id, [](const Frame& frame, ScopeId id) {
		return frame.id < id;
	});
	if (ii == frames.end() || ii->id != id || ii == frames.begin()) {
		return 0;
	}
	return (ii - 1)->id;
}

auto ScopeStack::IsOpen(ScopeId id) const -> bool {
	return Find(id) != nullptr;
}

auto ScopeStack::Root(RawValue value) -> uint32_t {
	if (frames.empty()) {
		throw HandleEscapedScopeError{"No scope is open"};
	}
	auto& slots = frames.back().slots;
	slots.push_back(value);
	return static_cast<uint32_t>(slots.size() - 1);
}

auto ScopeStack::Resolve(ScopeId id, uint32_t slot) const -> RawValue {
	if (id == 0) {
		throw HandleEscapedScopeError{"Handle is empty"};
	}
	const auto* frame = Find(id);
	if (frame == nullptr || slot >= frame->slots.size()) {
		throw HandleEscapedScopeError{"Handle used after its scope was closed"};
	}
	return frame->slots[slot];
}

auto ScopeStack::Escape(ScopeId id, uint32_t slot) -> uint32_t {
	auto* frame = Find(id);
	if (frame == nullptr || slot >= frame->slots.size()) {
		throw HandleEscapedScopeError{"Handle used after its scope was closed"};
	}
	if (frame == &frames.front()) {
		throw HandleEscapedScopeError{"The outermost scope has no parent to escape into"};
	}
	if (frame->escaped) {
		throw HandleEscapedScopeError{"A scope may only escape one value"};
	}
	frame->escaped = true;
	RawValue escaped = binding.Escape(frame->marker, frame->slots[slot]);
	auto& parent_slots = (frame - 1)->slots;
	parent_slots.push_back(escaped);
	return static_cast<uint32_t>(parent_slots.size() - 1);
}

auto ScopeStack::EscapeToEngine(ScopeId id, uint32_t slot) -> RawValue {
	auto* frame = Find(id);
	if (frame == nullptr || slot >= frame->slots.size()) {
		throw HandleEscapedScopeError{"Handle used after its scope was closed"};
	}
	if (frame->escaped) {
		throw HandleEscapedScopeError{"A scope may only escape one value"};
	}
	frame->escaped = true;
	return binding.Escape(frame->marker, frame->slots[slot]);
}

auto ScopeStack::Find(ScopeId id) -> Frame* {
	return const_cast<Frame*>(static_cast<const ScopeStack*>(this)->Find(id));
}

auto ScopeStack::Find(ScopeId id) const -> const Frame* {
	// Ids are handed out in increasing order and frames are LIFO, so the stack is sorted
	auto ii = std::lower_bound(frames.begin(), frames.end(), id, [](const Frame& frame, ScopeId id) {
		return frame.id < id;
	});
	if (ii == frames.end() || ii->id != id) {
		return nullptr;
	}
	return &*ii;
}

} // namespace tether
