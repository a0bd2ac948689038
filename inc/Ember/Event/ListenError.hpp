/// @file   ListenError.hpp
/// @brief  Why a listener could not run

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace ember::event {

/// A listener has to lock every piece of data it declared before it can run.
/// This can fail in two ways, and only the event handler ever sees which one.
enum class ListenError : uint8_t {
	/// One of the weak references could not be upgraded, the data was deleted.
	/// The listener can never run again and is removed from its handler.
	RequirementDeleted,
	/// The data exists but somebody else holds a conflicting lock on it.
	/// The listener is retried later in the same dispatch.
	LockUnavailable
};

/// Result of a single listener attempt
using ListenResult = std::expected<void, ListenError>;

[[nodiscard]]
constexpr std::string_view ToString(ListenError error) noexcept {
	switch (error) {
		case ListenError::RequirementDeleted: return "RequirementDeleted";
		case ListenError::LockUnavailable: return "LockUnavailable";
	}
	return "Unknown";
}

}
