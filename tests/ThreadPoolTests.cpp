#include <Ember/Log.hpp>
#include <Ember/ThreadPool.hpp>
#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace ember;

TEST(ThreadPool, ParallelForVisitsEveryIndexOnce) {
	ThreadPool pool;
	pool.Init(4);

	std::vector<std::atomic<int>> hits(1000);
	pool.ParallelFor(hits.size(), [&hits](size_t i) {
		hits[i]++;
	});

	for (size_t i = 0; i < hits.size(); i++) {
		EXPECT_EQ(hits[i].load(), 1) << "index " << i;
	}
}

TEST(ThreadPool, ParallelForWithoutWorkersRunsInline) {
	ThreadPool pool;

	int sum = 0;
	pool.ParallelFor(5, [&sum](size_t i) {
		sum += static_cast<int>(i);
	});
	EXPECT_EQ(sum, 10);
}

TEST(ThreadPool, ParallelForRethrowsAfterJoining) {
	ThreadPool pool;
	pool.Init(2);

	std::atomic<int> ran = 0;
	EXPECT_THROW(
	    pool.ParallelFor(
	        64,
	        [&ran](size_t i) {
		        ran++;
		        if (i == 10) {
			        throw std::runtime_error("boom");
		        }
	        }
	    ),
	    std::runtime_error
	);
	EXPECT_EQ(ran.load(), 64);
}

TEST(ThreadPool, NestedParallelForFinishes) {
	ThreadPool pool;
	pool.Init(2);

	std::atomic<int> total = 0;
	pool.ParallelFor(8, [&](size_t) {
		pool.ParallelFor(8, [&total](size_t) {
			total++;
		});
	});
	EXPECT_EQ(total.load(), 64);
}

TEST(ThreadPool, InitTwiceThrows) {
	ThreadPool pool;
	pool.Init(1);
	EXPECT_THROW(pool.Init(1), EmberException);
}

TEST(ThreadPool, QueueAfterDestroyThrows) {
	ThreadPool pool;
	pool.Init(1);
	pool.Destroy();
	EXPECT_EQ(pool.size(), 0u);
	EXPECT_THROW(pool.QueueJob([] { }), EmberException);
}

TEST(ThreadPool, GlobalPoolIsShared) {
	auto first = ThreadPool::Global();
	auto second = ThreadPool::Global();
	EXPECT_EQ(first, second);
	EXPECT_GT(first->size(), 0u);
}
