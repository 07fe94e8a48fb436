#include <gtest/gtest.h>

#include "lib/thread_pool.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace tether;

namespace {

struct Counter {
	std::atomic<int> runs{0};
	std::atomic<int> on_pool{0};
};

void Count(void* param) {
	auto* counter = static_cast<Counter*>(param);
	if (thread_pool_t::is_pool_thread()) {
		++counter->on_pool;
	}
	std::this_thread::sleep_for(std::chrono::microseconds{100});
	++counter->runs;
}

} // anonymous namespace

TEST(ThreadPoolTest, RunsEverythingOnPoolThreads) {
	Counter counter;
	{
		thread_pool_t pool{3};
		EXPECT_EQ(pool.size(), 3U);
		for (int ii = 0; ii < 100; ++ii) {
			ASSERT_TRUE(pool.exec(&Count, &counter));
		}
	}
	// Shutdown finishes queued jobs before joining
	EXPECT_EQ(counter.runs.load(), 100);
	EXPECT_EQ(counter.on_pool.load(), 100);
	EXPECT_FALSE(thread_pool_t::is_pool_thread());
}

TEST(ThreadPoolTest, ExecAfterShutdownFails) {
	Counter counter;
	thread_pool_t pool{1};
	pool.shutdown();
	EXPECT_FALSE(pool.exec(&Count, &counter));
	// Twice is fine
	pool.shutdown();
	EXPECT_EQ(counter.runs.load(), 0);
}
