#include "thread_pool.h"

namespace tether {
namespace {
	thread_local bool pool_thread = false;
}

thread_pool_t::thread_pool_t(size_t size) {
	if (size == 0) {
		size = 1;
	}
	threads.reserve(size);
	for (size_t ii = 0; ii < size; ++ii) {
		threads.emplace_back([this]() { run(); });
	}
}

auto thread_pool_t::exec(entry_t* entry, void* param) -> bool {
	{
		std::lock_guard<std::mutex> lock{mutex};
		if (should_exit) {
			return false;
		}
		jobs.push_back(job_t{entry, param});
	}
	cv.notify_one();
	return true;
}

void thread_pool_t::shutdown() {
	{
		std::lock_guard<std::mutex> lock{mutex};
		if (should_exit) {
			return;
		}
		should_exit = true;
	}
	cv.notify_all();
	for (auto& thread : threads) {
		thread.join();
	}
	threads.clear();
}

auto thread_pool_t::is_pool_thread() -> bool {
	return pool_thread;
}

void thread_pool_t::run() {
	pool_thread = true;
	std::unique_lock<std::mutex> lock{mutex};
	while (true) {
		if (jobs.empty()) {
			if (should_exit) {
				return;
			}
			cv.wait(lock);
		} else {
			job_t job = jobs.front();
			jobs.pop_front();
			lock.unlock();
			job.entry(job.param);
			lock.lock();
		}
	}
}

} // namespace tether
