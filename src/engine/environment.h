#pragma once
#include "binding.h"
#include "config.h"
#include "lib/lockable.h"
#include "scope/scope_stack.h"
#include <deque>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace tether {

class Context;
class FinalizeContext;
class FunctionContext;
class ModuleContext;
class TaskContext;
template <class Type> class Handle;
struct JsValue;

using NativeFunction = std::function<Handle<JsValue>(FunctionContext&)>;

#ifdef TETHER_TASKS
class Channel;
class thread_pool_t;
namespace detail {
class ChannelState;
}
#endif

namespace detail {

// Persistent references whose owner let go of them without a Context. They are released at the
// next Context entry. Shared with `Root` so a Root that outlives its Environment stays harmless.
class ReleaseQueue {
	public:
		void Push(RawReference reference);
		auto Take() -> std::vector<RawReference>;
		// Further pushes are discarded
		void Close();

	private:
		struct State {
			std::vector<RawReference> references;
			bool closed = false;
		};
		lockable_t<State> state;
};

// Storage for one `InstanceLocal`
struct LocalSlot {
	std::shared_ptr<void> value;
	bool initializing = false;
};

} // namespace detail

/**
 * One instance of the library per loaded module. This owns the engine binding and everything that
 * must not outlive it: the scope arena, the worker pool, every channel, and instance-local storage.
 * It also tracks which Context, if any, currently holds the engine thread. It is created when the
 * module initializes and torn down explicitly by `Dispose` (or its destructor).
 */
class Environment {
	friend class Context;

	public:
		// Suspends the active context while the engine runs script, which may re-enter native code
		class Suspend {
			public:
				explicit Suspend(Environment& env) : env{env}, previous{env.active} { env.active = nullptr; }
				Suspend(const Suspend&) = delete;
				~Suspend() { env.active = previous; }
				auto operator=(const Suspend&) = delete;

			private:
				Environment& env;
				Context* previous;
		};

		Environment(std::unique_ptr<EngineBinding> binding, Config config);
		Environment(const Environment&) = delete;
		~Environment();
		auto operator=(const Environment&) = delete;

		// Entry points, called by the binding on the engine thread. Each returns false if it left an
		// exception pending in the engine.
		auto InitModule(RawValue exports, const std::function<void(ModuleContext&)>& init) -> bool;
		auto InvokeFunction(const NativeFunction& function, CallbackArgs& args) -> bool;
		void RunInTaskContext(const std::function<void(TaskContext&)>& fn);
		void RunFinalizer(const std::function<void(FinalizeContext&)>& fn);

		// Wraps `function` in an entry the binding can own
		auto MakeFunctionEntry(NativeFunction function) -> std::unique_ptr<FunctionEntry>;

		void Dispose();

		auto Binding() -> EngineBinding& { return *binding; }
		auto Scopes() -> ScopeStack& { return scopes; }
		auto GetConfig() const -> const Config& { return config; }
		auto ActiveTier() const -> Tier { return active_tier; }
		auto ActiveContext() const -> Context* { return active; }
		auto IsDisposed() const -> bool { return disposed; }
		auto EngineThread() const -> std::thread::id { return engine_thread; }
		auto OnEngineThread() const -> bool;
		auto Releases() const -> const std::shared_ptr<detail::ReleaseQueue>& { return releases; }

		// Slot for the `InstanceLocal` with the given key
		auto Local(size_t key) -> detail::LocalSlot&;

#ifdef TETHER_TASKS
		auto Pool() -> thread_pool_t&;
		// Unreferenced channel used internally for work that must not keep the loop alive
		auto SystemChannel() -> Channel&;
		void RegisterChannel(std::shared_ptr<detail::ChannelState> channel);
		void UnregisterChannel(detail::ChannelState* channel);
#endif

	private:
		void Enter(Context* cx);
		void Leave(Context* cx);
		void ReclaimReferences();

		std::unique_ptr<EngineBinding> binding;
		Config config;
		Tier active_tier;
		ScopeStack scopes;
		std::thread::id engine_thread;
		Context* active = nullptr;
		bool disposed = false;
		std::shared_ptr<detail::ReleaseQueue> releases;
		std::deque<detail::LocalSlot> locals;
#ifdef TETHER_TASKS
		std::unique_ptr<thread_pool_t> pool;
		std::vector<std::shared_ptr<detail::ChannelState>> channels;
		std::unique_ptr<Channel> system_channel;
#endif
};

} // namespace tether
