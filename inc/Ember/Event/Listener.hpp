/// @file   Listener.hpp
/// @brief  A single reaction registered on an event handler

#pragma once

#include <Ember/Event/ListenError.hpp>
#include <concepts>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace ember::event {

using ListenerID = int64_t;

/// Anything that can be raised through an EventHandler. Events are plain value
/// types, they are handed to every listener by const reference.
template<typename E>
concept EventType = std::is_object_v<E> && std::move_constructible<E>;

/// @brief Listens for an event
///
/// Don't build these by hand unless you need the id, event::Listen() generates
/// the function from a capability bundle. Once inserted the listener belongs to
/// its EventHandler.
template<EventType E>
struct Listener {
	using Function = std::function<ListenResult(const E&)>;

	/// Unique id inside the owning handler, see EventHandler::NewId()
	ListenerID id = -1;

	/// Tries to lock everything the listener needs and runs the reaction
	Function func;

	/// @brief Runs one attempt of the listener
	/// @return Nothing on success, otherwise why the reaction did not run
	[[nodiscard]]
	ListenResult Execute(const E& e) const {
		return func(e);
	}
};

}
