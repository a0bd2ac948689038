/// @file LockHolder.hpp
/// @brief Keeps a shared cell locked from another thread for the duration of a test

#pragma once

#include <Ember/Event/Shared.hpp>
#include <future>
#include <thread>

namespace ember::test {

/// Locks are not recursive and the dispatching thread runs listeners itself,
/// so contention has to come from a thread that never dispatches.
template<typename T>
class LockHolder {
public:
	enum class Mode {
		Read,
		Write
	};

	LockHolder(Strong<T> cell, Mode mode) {
		std::promise<void> locked;
		auto is_locked = locked.get_future();
		m_thread = std::thread([cell = std::move(cell), mode, locked = std::move(locked), release = m_release.get_future()]() mutable {
			if (mode == Mode::Read) {
				auto guard = cell->Read();
				locked.set_value();
				release.wait();
			} else {
				auto guard = cell->Write();
				locked.set_value();
				release.wait();
			}
		});
		is_locked.wait();
	}

	~LockHolder() {
		Release();
	}

	LockHolder(const LockHolder&) = delete;
	LockHolder& operator=(const LockHolder&) = delete;

	void Release() {
		if (m_thread.joinable()) {
			m_release.set_value();
			m_thread.join();
		}
	}

private:
	std::promise<void> m_release;
	std::thread m_thread;
};

}
