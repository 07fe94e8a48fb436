#pragma once
#include "handle.h"
#include <cstdint>
#include <vector>

namespace tether {

/**
 * Arena of every open scope on the engine thread. Each frame pairs an engine handle-scope marker
 * with the raw values rooted in it; a `Handle` is an index into one of these frames. Frames are
 * pushed and popped strictly LIFO so the native call stack and the engine's own scope stack never
 * drift apart.
 */
class ScopeStack {
	public:
		explicit ScopeStack(EngineBinding& binding) : binding{binding} {}
		ScopeStack(const ScopeStack&) = delete;
		~ScopeStack();
		auto operator=(const ScopeStack&) = delete;

		auto Push() -> ScopeId;
		// Only the innermost scope may be popped
		void Pop(ScopeId id);

		auto Top() const -> ScopeId;
		// 0 for the outermost scope
		auto Parent(ScopeId id) const -> ScopeId;
		auto IsOpen(ScopeId id) const -> bool;

		// Roots `value` in the innermost scope
		auto Root(RawValue value) -> uint32_t;
		auto Resolve(ScopeId id, uint32_t slot) const -> RawValue;
		// Re-roots a value from scope `id` into its immediate parent. Allowed once per scope.
		auto Escape(ScopeId id, uint32_t slot) -> uint32_t;
		// Escapes a value out of scope `id` into whatever engine scope encloses the whole stack, for
		// handing a result back to the engine. Shares the once-per-scope allowance with `Escape`.
		auto EscapeToEngine(ScopeId id, uint32_t slot) -> RawValue;

	private:
		struct Frame {
			ScopeId id;
			ScopeMarker marker;
			std::vector<RawValue> slots;
			bool escaped = false;
		};

		auto Find(ScopeId id) -> Frame*;
		auto Find(ScopeId id) const -> const Frame*;

		EngineBinding& binding;
		std::vector<Frame> frames;
		ScopeId next_id = 1;
};

} // namespace tether
