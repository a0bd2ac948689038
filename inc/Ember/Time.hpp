/**
 * @file Time.hpp
 * @brief Frame clock driving the tick events
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

namespace ember {

/// @brief Measures the time between frames
///
/// Keeps the timestamps of the last @c samples frames so it can report an
/// average frame time alongside the delta of the current frame. Every Context
/// owns its own Time, nothing here is global.
class Time {
public:
	using clock_t = std::chrono::steady_clock;
	using time_point_t = clock_t::time_point;

	/// @param samples Number of frames averaged by average_delta(), at least 2
	/// @param max_delta Upper bound for delta() in seconds, 0 disables the clamp
	explicit Time(size_t samples = 512, double max_delta = 0.0);

	/// @brief Starts a new frame and returns the raw time since the previous one
	double Tick() noexcept;

	/// @brief Starts a new frame stamped with @p now, used by tests and replays
	double Tick(time_point_t now) noexcept;

	/// @brief Returns the time the last frame took to process, scaled and clamped
	[[nodiscard]]
	double delta() const noexcept {
		return m_delta;
	}

	/// @brief Returns delta without scaling or clamping
	[[nodiscard]]
	double raw_delta() const noexcept {
		return m_deltaRaw;
	}

	/// @brief Average time between the frames currently held in the sample window
	[[nodiscard]]
	double average_delta() const noexcept;

	/// @brief Returns the time since the clock was created
	[[nodiscard]]
	double uptime() const noexcept;

	/// @brief Returns value of multiplier
	[[nodiscard]]
	double scale() const noexcept {
		return m_deltaScale;
	}

	/// @brief Modifies value of multiplier
	void scale(double value) noexcept {
		m_deltaScale = value;
	}

	[[nodiscard]]
	size_t samples() const noexcept {
		return m_times.size();
	}

private:
	/// @brief Ring buffer of frame timestamps
	std::vector<time_point_t> m_times;

	/// @brief Slot the next timestamp is written to
	size_t m_offset = 0;

	/// @brief Timestamp for application start
	time_point_t m_startTime;

	/// @brief Timestamp of the latest Tick
	time_point_t m_now;

	double m_maxDelta = 0.0;
	double m_deltaRaw = 0.0;
	double m_delta = 0.0;
	double m_deltaScale = 1.0;
};

}
