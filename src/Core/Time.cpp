#include <Ember/Time.hpp>
#include <algorithm>

namespace ember {

Time::Time(size_t samples, double max_delta) : m_maxDelta(max_delta) {
	m_startTime = clock_t::now();
	m_now = m_startTime;
	m_times.assign(std::max<size_t>(samples, 2), m_startTime);
}

double Time::Tick() noexcept {
	return Tick(clock_t::now());
}

double Time::Tick(time_point_t now) noexcept {
	const size_t previous = m_offset == 0 ? m_times.size() - 1 : m_offset - 1;

	m_times[m_offset] = now;
	m_offset = (m_offset + 1) % m_times.size();
	m_now = now;

	std::chrono::duration<double> t = now - m_times[previous];
	m_deltaRaw = t.count();
	m_delta = m_deltaRaw * m_deltaScale;
	if (m_maxDelta > 0.0) {
		m_delta = std::min(m_delta, m_maxDelta);
	}
	return m_deltaRaw;
}

double Time::average_delta() const noexcept {
	// The newest sample sits just before m_offset, the oldest at m_offset
	const size_t newest = m_offset == 0 ? m_times.size() - 1 : m_offset - 1;
	std::chrono::duration<double> span = m_times[newest] - m_times[m_offset];
	return span.count() / static_cast<double>(m_times.size() - 1);
}

double Time::uptime() const noexcept {
	std::chrono::duration<double> t = m_now - m_startTime;
	return t.count();
}

}
