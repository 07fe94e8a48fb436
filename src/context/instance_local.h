#pragma once
#include "context.h"
#include <atomic>
#include <memory>
#include <optional>

namespace tether {
namespace detail {
extern std::atomic<size_t> InstanceLocalSize;

// Marks a slot as initializing for the lifetime of the guard
class LocalInitGuard {
	public:
		explicit LocalInitGuard(LocalSlot& slot) : slot{slot} {
			if (slot.initializing) {
				throw ContextReentrancyError{"InstanceLocal initializer re-entered itself"};
			}
			slot.initializing = true;
		}
		LocalInitGuard(const LocalInitGuard&) = delete;
		~LocalInitGuard() { slot.initializing = false; }
		auto operator=(const LocalInitGuard&) = delete;

	private:
		LocalSlot& slot;
};

} // namespace detail

/**
 * Like thread_local data, but specific to an Environment instead. Each module instance (each
 * worker, in a host with several) sees its own value. Values are destroyed when the Environment is
 * disposed.
 */
template <class Type>
class InstanceLocal {
	public:
		InstanceLocal() = default;
		InstanceLocal(const InstanceLocal&) = delete;
		~InstanceLocal() = default;
		auto operator=(const InstanceLocal&) = delete;

		// nullptr until initialized
		auto Get(Context& cx) -> Type* {
			cx.Check();
			return static_cast<Type*>(cx.GetEnvironment().Local(key).value.get());
		}

		auto GetOrInit(Context& cx, Type value) -> Type& {
			return GetOrInitWith(cx, [&](Context& /*cx*/) { return std::move(value); });
		}

		auto GetOrInitDefault(Context& cx) -> Type& {
			return GetOrInitWith(cx, [](Context& /*cx*/) { return Type{}; });
		}

		// `init(cx)` runs at most once per Environment unless it throws
		template <class Fn>
		auto GetOrInitWith(Context& cx, Fn init) -> Type& {
			if (auto* value = Get(cx)) {
				return *value;
			}
			auto& slot = cx.GetEnvironment().Local(key);
			std::shared_ptr<Type> value;
			{
				detail::LocalInitGuard guard{slot};
				value = std::make_shared<Type>(init(cx));
			}
			slot.value = value;
			return *value;
		}

		// `init(cx)` returns `std::optional<Type>`. An empty result leaves the slot uninitialized and
		// returns nullptr.
		template <class Fn>
		auto GetOrTryInit(Context& cx, Fn init) -> Type* {
			if (auto* value = Get(cx)) {
				return value;
			}
			auto& slot = cx.GetEnvironment().Local(key);
			std::optional<Type> result;
			{
				detail::LocalInitGuard guard{slot};
				result = init(cx);
			}
			if (!result) {
				return nullptr;
			}
			auto value = std::make_shared<Type>(std::move(*result));
			slot.value = value;
			return value.get();
		}

	private:
		size_t key{detail::InstanceLocalSize++};
};

} // namespace tether
