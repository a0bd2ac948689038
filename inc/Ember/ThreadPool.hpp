/**
 * @file ThreadPool.hpp
 * @brief Workers the event handlers fan their listeners out on
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ember {

/**
 * @class ThreadPool
 * @brief A fixed set of worker threads pulling jobs from one queue
 *
 * Event handlers only use ParallelFor(). QueueJob() is there for fire and
 * forget work, it gives no completion guarantee.
 *
 * @code
 * auto pool = std::make_shared<ThreadPool>();
 * pool->Init(4);
 *
 * std::vector<int> squares(1000);
 * pool->ParallelFor(squares.size(), [&](size_t i) {
 *     squares[i] = static_cast<int>(i * i);
 * });
 * @endcode
 */
class ThreadPool {
public:
	ThreadPool() = default;
	~ThreadPool();

	ThreadPool(const ThreadPool&) = delete;
	ThreadPool& operator=(const ThreadPool&) = delete;

	/**
	 * @brief Starts the workers
	 * @param size Worker count, 0 (or more than the hardware runs at once) means one per hardware thread
	 * @throws EmberException if the pool is already running
	 */
	void Init(size_t size);

	/// @throws EmberException once Destroy() has been called
	void QueueJob(std::function<void()>&& job);

	/**
	 * @brief Calls @p job with every index in [0, count), blocks until all calls returned
	 *
	 * The caller works through the indices alongside the workers, so calling
	 * this from inside a job can't deadlock, it just gets less help. An
	 * exception thrown by @p job does not stop the other indices, the first one
	 * is rethrown here at the end.
	 */
	void ParallelFor(size_t count, const std::function<void(size_t)>& job);

	/// @brief Joins the workers, jobs that did not start yet are dropped
	void Destroy();

	[[nodiscard]]
	size_t size() const noexcept {
		return m_workers.size();
	}

	/// @brief Process-wide pool sized to the hardware, created on first use
	[[nodiscard]]
	static std::shared_ptr<ThreadPool> Global();

private:
	void ThreadLoop();

	bool m_shouldStop = false;
	std::mutex m_queueMutex;
	std::condition_variable m_condition;
	std::vector<std::thread> m_workers;
	std::queue<std::function<void()>> m_jobs;
};

}
