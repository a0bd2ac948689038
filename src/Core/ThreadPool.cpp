#include <Ember/Log.hpp>
#include <Ember/ThreadPool.hpp>
#include <algorithm>
#include <atomic>
#include <exception>

namespace ember {

namespace {

/// Shared between the caller of ParallelFor and the helper jobs it queued.
/// Helpers can outlive the call, so the loop body is owned here too.
struct Batch {
	Batch(size_t count, std::function<void(size_t)> job) : count(count), job(std::move(job)) { }

	const size_t count;
	const std::function<void(size_t)> job;
	std::atomic<size_t> next = 0;
	std::atomic<size_t> done = 0;

	std::mutex mutex;
	std::condition_variable finished;
	std::exception_ptr error;

	void Drain() {
		for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
			try {
				job(i);
			} catch (...) {
				std::lock_guard lock(mutex);
				if (!error) {
					error = std::current_exception();
				}
			}

			if (done.fetch_add(1) + 1 == count) {
				std::lock_guard lock(mutex);
				finished.notify_all();
			}
		}
	}
};

}

ThreadPool::~ThreadPool() {
	if (!m_workers.empty()) {
		Destroy();
	}
}

void ThreadPool::Init(size_t size) {
	if (!m_workers.empty()) {
		throw EmberException("Thread pool is already initialized");
	}

	const size_t max_thread_num = std::thread::hardware_concurrency();
	if (size == 0 || size > max_thread_num) {
		size = max_thread_num;
	}

	{
		std::lock_guard lock(m_queueMutex);
		m_shouldStop = false;
	}
	for (size_t i = 0; i < size; ++i) {
		m_workers.emplace_back(&ThreadPool::ThreadLoop, this);
	}

	EMBER_TRACE("Created thread pool with {0} workers", size);
}

void ThreadPool::QueueJob(std::function<void()>&& job) {
	{
		std::unique_lock<std::mutex> lock(m_queueMutex);
		if (m_shouldStop) {
			throw EmberException("Queued a job on a destroyed thread pool");
		}
		m_jobs.emplace(std::move(job));
	}
	m_condition.notify_one();
}

void ThreadPool::ParallelFor(size_t count, const std::function<void(size_t)>& job) {
	if (count == 0) {
		return;
	}

	// Nothing to share, skip the bookkeeping
	if (count == 1 || m_workers.empty()) {
		for (size_t i = 0; i < count; ++i) {
			job(i);
		}
		return;
	}

	auto batch = std::make_shared<Batch>(count, job);

	const size_t helpers = std::min(m_workers.size(), count - 1);
	for (size_t i = 0; i < helpers; ++i) {
		QueueJob([batch] {
			batch->Drain();
		});
	}

	batch->Drain();

	std::unique_lock lock(batch->mutex);
	batch->finished.wait(lock, [&batch] {
		return batch->done.load() == batch->count;
	});

	if (batch->error) {
		std::rethrow_exception(batch->error);
	}
}

void ThreadPool::Destroy() {
	{
		std::unique_lock<std::mutex> lock(m_queueMutex);
		m_shouldStop = true;
	}
	m_condition.notify_all();

	for (std::thread& active_thread : m_workers) {
		active_thread.join();
	}

	m_workers.clear();

	{
		std::unique_lock<std::mutex> lock(m_queueMutex);
		m_jobs = {};
	}

	EMBER_TRACE("Destroyed thread pool");
}

std::shared_ptr<ThreadPool> ThreadPool::Global() {
	static std::shared_ptr<ThreadPool> pool = [] {
		auto p = std::make_shared<ThreadPool>();
		p->Init(0);
		return p;
	}();
	return pool;
}

void ThreadPool::ThreadLoop() {
	while (true) {
		std::function<void()> job;

		{
			std::unique_lock<std::mutex> lock(m_queueMutex);
			m_condition.wait(lock, [this] {
				return !m_jobs.empty() || m_shouldStop;
			});
			if (m_shouldStop) {
				return;
			}
			job = std::move(m_jobs.front());
			m_jobs.pop();
		}

		job();
	}
}

}
