#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <type_traits>
#include <utility>

namespace tether {
namespace detail {

// Holds the lock and provides pointer semantics. A plain std::mutex is used throughout so any
// resource can pair with std::condition_variable.
template <class Lockable>
class lock_holder_t {
	public:
		explicit lock_holder_t(Lockable& lockable) : lockable{lockable}, lock{lockable.mutex} {}

		auto operator*() -> auto& { return lockable.resource; }
		auto operator*() const -> auto& { return lockable.resource; }
		auto operator->() { return &lockable.resource; }
		auto operator->() const { return &lockable.resource; }

		void unlock() { lock.unlock(); }

	protected:
		Lockable& lockable;
		std::unique_lock<std::mutex> lock;
};

// Adds `wait`, `wait_until` and `wait_for` to a lock when the resource is waitable
template <class Lockable, bool Waitable>
class lock_t : public lock_holder_t<Lockable> {
	using lock_holder_t<Lockable>::lock_holder_t;
};

template <class Lockable>
class lock_t<Lockable, true> : public lock_holder_t<Lockable> {
	public:
		using lock_holder_t<Lockable>::lock_holder_t;

		void wait() {
			this->lockable.cv.wait(this->lock);
		}

		// Returns false if `deadline` passed before a notification arrived
		template <class Clock, class Duration>
		auto wait_until(const std::chrono::time_point<Clock, Duration>& deadline) -> bool {
			return this->lockable.cv.wait_until(this->lock, deadline) == std::cv_status::no_timeout;
		}

		template <class Rep, class Period>
		auto wait_for(const std::chrono::duration<Rep, Period>& duration) -> bool {
			return wait_until(std::chrono::steady_clock::now() + duration);
		}
};

// `condition_variable` storage, only present on waitable resources
template <bool Waitable>
class condition_variable_holder_t {};

template <>
class condition_variable_holder_t<true> {
	template <class, bool> friend class lock_t;

	public:
		void notify_one() { cv.notify_one(); }
		void notify_all() { cv.notify_all(); }

	private:
		mutable std::condition_variable cv;
};

} // namespace detail

/**
 * Bundles a resource with the mutex that guards it. The resource can only be reached through the
 * lock object returned by `read()` or `write()`, so it's not possible to touch it unlocked.
 */
template <class Type, bool Waitable = false>
class lockable_t : public detail::condition_variable_holder_t<Waitable> {
	template <class> friend class detail::lock_holder_t;
	template <class, bool> friend class detail::lock_t;

	public:
		lockable_t() = default;
		template <class... Args>
		explicit lockable_t(Args&&... args) : resource{std::forward<Args>(args)...} {}
		lockable_t(const lockable_t&) = delete;
		~lockable_t() = default;
		auto operator=(const lockable_t&) = delete;

		auto read() const {
			return detail::lock_t<const lockable_t, Waitable>{*this};
		}

		auto write() {
			return detail::lock_t<lockable_t, Waitable>{*this};
		}

	private:
		Type resource{};
		mutable std::mutex mutex;
};

} // namespace tether
