/// @file   RetryPolicy.hpp
/// @brief  How long a dispatch keeps retrying contended listeners

#pragma once

#include <chrono>

namespace ember::event {

/// Listeners that hit a locked capability are retried in rounds. The first
/// @c spinRounds rounds only yield the thread, later rounds sleep with an
/// exponential backoff capped at @c maxBackoff.
///
/// After @c maxRounds retry rounds the dispatch gives up on the listeners that
/// are still contended. They stay registered and get another chance with the
/// next event. A value of 0 retries until every listener has resolved.
struct RetryPolicy {
	unsigned maxRounds = 64;
	unsigned spinRounds = 8;
	std::chrono::microseconds initialBackoff { 50 };
	std::chrono::microseconds maxBackoff { 1000 };

	/// @brief True if another retry round is allowed after @p round rounds
	[[nodiscard]]
	bool allows(unsigned round) const noexcept {
		return maxRounds == 0 || round <= maxRounds;
	}

	/// @brief Time slept before retry round @p round (1-based), zero means yield
	[[nodiscard]]
	std::chrono::microseconds backoff(unsigned round) const noexcept;

	/// @brief Blocks the calling thread before retry round @p round
	void Wait(unsigned round) const;
};

}
