/// @file   Shared.hpp
/// @brief  Reader/writer locked cell reachable through strong and weak references
///
/// Every piece of state a listener can touch lives in a Shared<T>. Owners keep
/// a Strong<T>, everybody else keeps a Weak<T> and has to upgrade it before use.
/// Locking always goes through a guard that also holds a strong reference, so a
/// value can't be destroyed while someone has it locked.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>

namespace ember {

template<typename T>
class Shared;

/// Owning reference to a shared cell
template<typename T>
using Strong = std::shared_ptr<Shared<T>>;

/// Non-owning reference to a shared cell, lock() it to get a Strong<T> or null
template<typename T>
using Weak = std::weak_ptr<Shared<T>>;

/// @brief Shared (read) access to a cell, released on destruction
template<typename T>
class ReadGuard {
public:
	ReadGuard(ReadGuard&&) noexcept = default;
	ReadGuard& operator=(ReadGuard&&) noexcept = default;
	ReadGuard(const ReadGuard&) = delete;
	ReadGuard& operator=(const ReadGuard&) = delete;

	[[nodiscard]]
	const T& get() const noexcept {
		return *m_value;
	}

	const T& operator*() const noexcept {
		return *m_value;
	}

	const T* operator->() const noexcept {
		return m_value;
	}

private:
	friend class Shared<T>;

	ReadGuard(Strong<T> owner, std::shared_lock<std::shared_mutex>&& lock, const T* value) :
	    m_owner(std::move(owner)),
	    m_lock(std::move(lock)),
	    m_value(value) { }

	// Declared before the lock so the lock is released first
	Strong<T> m_owner;
	std::shared_lock<std::shared_mutex> m_lock;
	const T* m_value;
};

/// @brief Exclusive (write) access to a cell, released on destruction
template<typename T>
class WriteGuard {
public:
	WriteGuard(WriteGuard&&) noexcept = default;
	WriteGuard& operator=(WriteGuard&&) noexcept = default;
	WriteGuard(const WriteGuard&) = delete;
	WriteGuard& operator=(const WriteGuard&) = delete;

	[[nodiscard]]
	T& get() const noexcept {
		return *m_value;
	}

	T& operator*() const noexcept {
		return *m_value;
	}

	T* operator->() const noexcept {
		return m_value;
	}

private:
	friend class Shared<T>;

	WriteGuard(Strong<T> owner, std::unique_lock<std::shared_mutex>&& lock, T* value) :
	    m_owner(std::move(owner)),
	    m_lock(std::move(lock)),
	    m_value(value) { }

	Strong<T> m_owner;
	std::unique_lock<std::shared_mutex> m_lock;
	T* m_value;
};

/// @class ember::Shared
/// @brief A value behind a reader/writer lock
///
/// Create cells with MakeShared(), a Shared<T> that is not owned by a
/// std::shared_ptr can't hand out guards.
///
/// @note Locks are not recursive: a thread holding a guard must not try to
/// lock the same cell again.
template<typename T>
class Shared final : public std::enable_shared_from_this<Shared<T>> {
public:
	template<typename... Args>
	explicit Shared(std::in_place_t, Args&&... args) : m_value(std::forward<Args>(args)...) { }

	Shared(const Shared&) = delete;
	Shared& operator=(const Shared&) = delete;
	Shared(Shared&&) = delete;
	Shared& operator=(Shared&&) = delete;

	/// @brief Tries to get shared access without blocking
	/// @return The guard, or nullopt if a writer currently holds the cell
	[[nodiscard]]
	std::optional<ReadGuard<T>> TryRead() {
		std::shared_lock lock(m_mutex, std::try_to_lock);
		if (!lock.owns_lock()) {
			return std::nullopt;
		}
		return ReadGuard<T>(this->shared_from_this(), std::move(lock), &m_value);
	}

	/// @brief Tries to get exclusive access without blocking
	/// @return The guard, or nullopt if anybody else currently holds the cell
	[[nodiscard]]
	std::optional<WriteGuard<T>> TryWrite() {
		std::unique_lock lock(m_mutex, std::try_to_lock);
		if (!lock.owns_lock()) {
			return std::nullopt;
		}
		return WriteGuard<T>(this->shared_from_this(), std::move(lock), &m_value);
	}

	/// @brief Blocks until shared access is granted
	[[nodiscard]]
	ReadGuard<T> Read() {
		std::shared_lock lock(m_mutex);
		return ReadGuard<T>(this->shared_from_this(), std::move(lock), &m_value);
	}

	/// @brief Blocks until exclusive access is granted
	[[nodiscard]]
	WriteGuard<T> Write() {
		std::unique_lock lock(m_mutex);
		return WriteGuard<T>(this->shared_from_this(), std::move(lock), &m_value);
	}

private:
	std::shared_mutex m_mutex;
	T m_value;
};

/// @brief Creates a new shared cell holding a T built from @p args
template<typename T, typename... Args>
[[nodiscard]]
Strong<T> MakeShared(Args&&... args) {
	return std::make_shared<Shared<T>>(std::in_place, std::forward<Args>(args)...);
}

}
