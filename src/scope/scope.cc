#include "scope.h"
#include "context/context.h"

namespace tether {
namespace {

auto CheckedStack(Context& cx) -> ScopeStack& {
	cx.Check();
	return cx.GetEnvironment().Scopes();
}

} // anonymous namespace

Scope::Scope(Context& cx) : stack{CheckedStack(cx)}, id{0}, parent{stack.Top()} {
	id = stack.Push();
}

void Scope::Close() {
	if (open) {
		open = false;
		stack.Pop(id);
	}
}

} // namespace tether
