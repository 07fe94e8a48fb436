#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace tether {

/**
 * Fixed-size pool of worker threads. Jobs are plain function pointers plus a parameter so that the
 * caller owns the lifetime of whatever `param` points to. Jobs run in submission order as threads
 * become available. Nothing is ever cancelled: `shutdown` lets queued jobs finish before joining.
 */
class thread_pool_t {
	public:
		using entry_t = void(void*);

		explicit thread_pool_t(size_t size);
		thread_pool_t(const thread_pool_t&) = delete;
		~thread_pool_t() { shutdown(); }
		auto operator= (const thread_pool_t&) = delete;

		// Returns false if the pool has been shut down, in which case `entry` is not invoked
		auto exec(entry_t* entry, void* param) -> bool;
		void shutdown();

		auto size() const -> size_t { return threads.size(); }
		static auto is_pool_thread() -> bool;

	private:
		struct job_t {
			entry_t* entry;
			void* param;
		};

		void run();

		std::mutex mutex;
		std::condition_variable cv;
		std::deque<job_t> jobs;
		std::vector<std::thread> threads;
		bool should_exit = false;
};

} // namespace tether
