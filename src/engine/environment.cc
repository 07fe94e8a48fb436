#include "environment.h"
#include "context/barrier.h"
#include "context/context.h"
#include "context/instance_local.h"
#include "error/translator.h"
#include "lib/log.h"
#ifdef TETHER_TASKS
#include "channel/channel.h"
#include "lib/thread_pool.h"
#endif
#include <algorithm>
#include <utility>

namespace tether {
namespace detail {

std::atomic<size_t> InstanceLocalSize{0};

void ReportBarrierError(Environment& env, const ExternalError& error) {
	if (IsProgrammingError(error.Kind())) {
		Log().error("Denied: {}", error.Describe());
	}
	if (!env.OnEngineThread()) {
		Log().error("Native entry point invoked off the engine thread: {}", error.Describe());
		return;
	}
	ErrorTranslator::Throw(env.Binding(), error);
}

/**
 * ReleaseQueue implementation
 */
void ReleaseQueue::Push(RawReference reference) {
	auto lock = state.write();
	if (!lock->closed) {
		lock->references.push_back(reference);
	}
}

auto ReleaseQueue::Take() -> std::vector<RawReference> {
	return std::exchange(state.write()->references, {});
}

void ReleaseQueue::Close() {
	auto lock = state.write();
	lock->closed = true;
	lock->references.clear();
}

namespace {

// Engine-owned record for a native function
class NativeFunctionEntry final : public FunctionEntry {
	public:
		NativeFunctionEntry(Environment& env, NativeFunction function) :
			env{env}, function{std::move(function)} {}

		auto Invoke(CallbackArgs& args) -> bool final {
			return env.InvokeFunction(function, args);
		}

	private:
		Environment& env;
		NativeFunction function;
};

} // anonymous namespace
} // namespace detail

/**
 * Environment implementation
 */
Environment::Environment(std::unique_ptr<EngineBinding> binding, Config config) :
		binding{std::move(binding)},
		config{std::move(config)},
		active_tier{kTierBase},
		scopes{*this->binding},
		engine_thread{std::this_thread::get_id()},
		releases{std::make_shared<detail::ReleaseQueue>()} {
	SetLogLevel(this->config.log_level);
	Tier max = this->binding->MaxTier();
	if (this->config.tier < kTierBase) {
		throw RuntimeRangeError{"Capability tier must be at least " + std::to_string(kTierBase)};
	}
	if (this->config.tier > max) {
		throw UnsupportedCapabilityError{
			"Configured capability tier " + std::to_string(this->config.tier) +
			" exceeds the engine's maximum tier " + std::to_string(max)
		};
	}
	active_tier = std::min(this->config.tier, max);
	if (this->config.tasks) {
#ifdef TETHER_TASKS
		RequireTier(active_tier, kTierThreadsafe, "The task subsystem");
		pool = std::make_unique<thread_pool_t>(this->config.WorkerThreads());
		system_channel.reset(new Channel{*this, false});
#else
		throw UnsupportedCapabilityError{"This build does not include the task subsystem"};
#endif
	}
	Log().debug("Environment initialized at capability tier {}", active_tier);
}

Environment::~Environment() {
	Dispose();
}

auto Environment::InitModule(RawValue exports, const std::function<void(ModuleContext&)>& init) -> bool {
	return detail::RunBarrier(*this, [&]() {
		ModuleContext cx{*this, exports};
		init(cx);
	});
}

auto Environment::InvokeFunction(const NativeFunction& function, CallbackArgs& args) -> bool {
	return detail::RunBarrier(*this, [&]() {
		FunctionContext cx{*this, args};
		args.result = cx.Return(function(cx));
	});
}

void Environment::RunInTaskContext(const std::function<void(TaskContext&)>& fn) {
	CallbackMarker marker = binding->OpenCallbackScope();
	bool ok = detail::RunBarrier(*this, [&]() {
		TaskContext cx{*this};
		fn(cx);
	});
	if (!ok) {
		Log().debug("Closure left an exception pending, it will be reported as uncaught");
	}
	binding->CloseCallbackScope(marker);
}

void Environment::RunFinalizer(const std::function<void(FinalizeContext&)>& fn) {
	if (disposed) {
		return;
	}
	bool ok = detail::RunBarrier(*this, [&]() {
		FinalizeContext cx{*this};
		fn(cx);
	});
	if (!ok && OnEngineThread() && binding->IsExceptionPending()) {
		// Nobody to throw to
		auto error = ErrorTranslator::FromEngine(*binding, binding->TakeException());
		Log().error("Exception thrown from a finalizer: {}", error.Describe());
	}
}

auto Environment::MakeFunctionEntry(NativeFunction function) -> std::unique_ptr<FunctionEntry> {
	return std::make_unique<detail::NativeFunctionEntry>(*this, std::move(function));
}

void Environment::Dispose() {
	if (disposed) {
		return;
	}
	disposed = true;
#ifdef TETHER_TASKS
	// Channels close before the pool joins, which wakes any worker parked in `SendAndWait`
	system_channel.reset();
	auto open_channels = channels;
	for (auto& channel : open_channels) {
		channel->Close();
	}
	channels.clear();
	if (pool) {
		// Queued work still runs. Its completions are dropped by the closed channels.
		pool->shutdown();
	}
#endif
	locals.clear();
	ReclaimReferences();
	releases->Close();
	Log().debug("Environment disposed");
}

auto Environment::OnEngineThread() const -> bool {
	return std::this_thread::get_id() == engine_thread;
}

auto Environment::Local(size_t key) -> detail::LocalSlot& {
	if (key >= locals.size()) {
		locals.resize(key + 1);
	}
	return locals[key];
}

#ifdef TETHER_TASKS
auto Environment::Pool() -> thread_pool_t& {
	if (!pool) {
		throw UnsupportedCapabilityError{"The task subsystem is disabled"};
	}
	return *pool;
}

auto Environment::SystemChannel() -> Channel& {
	if (!system_channel) {
		throw UnsupportedCapabilityError{"The task subsystem is disabled"};
	}
	return *system_channel;
}

void Environment::RegisterChannel(std::shared_ptr<detail::ChannelState> channel) {
	channels.push_back(std::move(channel));
}

void Environment::UnregisterChannel(detail::ChannelState* channel) {
	auto ii = std::find_if(channels.begin(), channels.end(), [&](const auto& ptr) {
		return ptr.get() == channel;
	});
	if (ii != channels.end()) {
		// Move the reference out first, the channel may be destroyed with it
		auto ref = std::move(*ii);
		channels.erase(ii);
	}
}
#endif

void Environment::Enter(Context* cx) {
	if (!OnEngineThread()) {
		throw ContextReentrancyError{"Contexts can only be created on the engine thread"};
	}
	if (active != nullptr) {
		throw ContextReentrancyError{"Another context is already active on this thread"};
	}
	if (disposed) {
		throw FatalRuntimeError{"Environment has been disposed"};
	}
	active = cx;
	ReclaimReferences();
}

void Environment::Leave(Context* cx) {
	if (active == cx) {
		active = nullptr;
	}
}

void Environment::ReclaimReferences() {
	for (auto reference : releases->Take()) {
		binding->Release(reference);
	}
}

} // namespace tether
