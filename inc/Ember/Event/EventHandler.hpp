/// @file   EventHandler.hpp
/// @brief  Owns the listeners of one event type and dispatches events to them

#pragma once

#include <Ember/Event/Listener.hpp>
#include <Ember/Event/RetryPolicy.hpp>
#include <Ember/Log.hpp>
#include <Ember/ThreadPool.hpp>
#include <exception>
#include <memory>
#include <mutex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace ember::event {

/// @class ember::event::EventHandler
/// @brief Dispatches events of type @c E to every registered listener
///
/// Handle() runs all listeners in parallel on the handler's thread pool. A
/// listener either runs, finds one of its capabilities locked and is retried,
/// or finds one of them deleted and is removed from the handler for good.
/// Handle() returns once every listener has run or been removed, or once the
/// retry policy gives up on the contended ones.
///
/// The listener set has its own lock, so listeners may subscribe new listeners
/// to the handler they are running on. Those are not part of the running
/// dispatch.
template<EventType E>
class EventHandler {
public:
	/// Dispatches on ThreadPool::Global() with the default retry policy
	EventHandler() : EventHandler(ThreadPool::Global()) { }

	explicit EventHandler(std::shared_ptr<ThreadPool> pool, RetryPolicy policy = {}) :
	    m_pool(pool ? std::move(pool) : ThreadPool::Global()),
	    m_policy(policy) { }

	EventHandler(const EventHandler&) = delete;
	EventHandler& operator=(const EventHandler&) = delete;

	/// @brief Reserves a new listener id, ids are never handed out twice
	[[nodiscard]]
	ListenerID NewId() {
		std::lock_guard lock(m_mutex);
		return m_nextId++;
	}

	/// @brief Registers a listener under its id
	void Insert(Listener<E>&& listener) {
		EMBER_ASSERT(listener.func, "Inserted listener {0} without a function", listener.id);
		auto ptr = std::make_shared<const Listener<E>>(std::move(listener));
		std::lock_guard lock(m_mutex);
		m_listeners.insert_or_assign(ptr->id, std::move(ptr));
	}

	/// @brief Removes a listener
	/// @return false if no listener with that id is registered
	bool Remove(ListenerID id) {
		std::lock_guard lock(m_mutex);
		return m_listeners.erase(id) > 0;
	}

	/// @brief Handles the given event by passing it through all registered listeners
	///
	/// If reactions throw, dispatch still finishes (retries and removals
	/// included) and the first exception is rethrown at the end.
	void Handle(E event);

	[[nodiscard]]
	size_t size() const {
		std::lock_guard lock(m_mutex);
		return m_listeners.size();
	}

	[[nodiscard]]
	bool empty() const {
		return size() == 0;
	}

	[[nodiscard]]
	bool contains(ListenerID id) const {
		std::lock_guard lock(m_mutex);
		return m_listeners.contains(id);
	}

	[[nodiscard]]
	RetryPolicy retry_policy() const {
		std::lock_guard lock(m_mutex);
		return m_policy;
	}

	void retry_policy(const RetryPolicy& policy) {
		std::lock_guard lock(m_mutex);
		m_policy = policy;
	}

private:
	using ListenerPtr = std::shared_ptr<const Listener<E>>;

	std::shared_ptr<ThreadPool> m_pool;

	/// Protects everything below
	mutable std::mutex m_mutex;
	RetryPolicy m_policy;
	ListenerID m_nextId = 0;
	std::unordered_map<ListenerID, ListenerPtr> m_listeners;

	/// Only one dispatch at a time per handler
	std::mutex m_dispatchMutex;
};

template<EventType E>
void EventHandler<E>::Handle(E event) {
	EMBER_PROFILE_ZONE_N("EventHandler::Handle");

	std::lock_guard dispatch_lock(m_dispatchMutex);

	// Don't hold the set lock during dispatch so listeners can subscribe
	std::vector<ListenerPtr> to_try;
	RetryPolicy policy;
	{
		std::lock_guard lock(m_mutex);
		to_try.reserve(m_listeners.size());
		for (const auto& [_, listener] : m_listeners) {
			to_try.push_back(listener);
		}
		policy = m_policy;
	}

	const E& e = event;
	std::vector<ListenerID> to_remove;
	std::vector<ListenResult> results;
	// A throwing reaction counts as run, the rest of the dispatch carries on
	std::exception_ptr error;

	unsigned round = 0;
	for (; !to_try.empty(); ++round) {
		if (round > 0) {
			if (!policy.allows(round)) {
				EMBER_WARN(
				    "{0} listener(s) for {1} still contended after {2} retries, deferring them to the next event",
				    to_try.size(),
				    typeid(E).name(),
				    policy.maxRounds
				);
				break;
			}
			policy.Wait(round);
		}

		results.assign(to_try.size(), ListenResult {});
		try {
			m_pool->ParallelFor(to_try.size(), [&to_try, &results, &e](size_t i) {
				results[i] = to_try[i]->Execute(e);
			});
		} catch (...) {
			if (!error) {
				error = std::current_exception();
			}
		}

		// Partition into the ones to retry and the ones that are gone for good
		std::vector<ListenerPtr> to_retry;
		for (size_t i = 0; i < to_try.size(); ++i) {
			if (results[i]) {
				continue;
			}
			switch (results[i].error()) {
				case ListenError::LockUnavailable: to_retry.push_back(std::move(to_try[i])); break;
				case ListenError::RequirementDeleted: to_remove.push_back(to_try[i]->id); break;
			}
		}
		to_try = std::move(to_retry);
	}
	EMBER_PROFILE_PLOT("EventHandler rounds", round);

	if (!to_remove.empty()) {
		{
			std::lock_guard lock(m_mutex);
			for (ListenerID id : to_remove) {
				m_listeners.erase(id);
			}
		}
		EMBER_TRACE("Removed {0} dead listener(s) for {1}", to_remove.size(), typeid(E).name());
	}

	if (error) {
		std::rethrow_exception(error);
	}
}

}
