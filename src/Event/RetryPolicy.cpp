#include <Ember/Event/RetryPolicy.hpp>
#include <algorithm>
#include <thread>

namespace ember::event {

std::chrono::microseconds RetryPolicy::backoff(unsigned round) const noexcept {
	if (round <= spinRounds) {
		return std::chrono::microseconds::zero();
	}

	auto delay = initialBackoff;
	for (unsigned i = spinRounds + 1; i < round && delay < maxBackoff; ++i) {
		// Doubling past half the cap could overflow the count
		if (delay > maxBackoff / 2) {
			return maxBackoff;
		}
		delay *= 2;
	}
	return std::min(delay, maxBackoff);
}

void RetryPolicy::Wait(unsigned round) const {
	const auto delay = backoff(round);
	if (delay.count() <= 0) {
		std::this_thread::yield();
	} else {
		std::this_thread::sleep_for(delay);
	}
}

}
