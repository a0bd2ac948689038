/// @file Events.hpp
/// @brief Events raised by the frame driver, and the handlers a scene keeps for them
///
/// Custom events need no registration, any value type works with
/// EventHandler<YourEvent>.

#pragma once

#include <Ember/Event/EventHandler.hpp>
#include <Ember/Input/KeyCodes.hpp>
#include <glm/glm.hpp>
#include <memory>
#include <optional>

namespace ember::event {

/// @brief Fired once every frame
struct TickEvent {
	/// Time between this frame and the previous one, in seconds
	double delta;
};

/// @brief A key was pressed or released
struct KeyboardEvent {
	/// Physical key, use it when the location of the key matters (movement controls)
	input::ScanCode scan_code;

	/// Pressed or released
	input::ElementState state;

	/// Semantic key if the host could resolve one, use it when the meaning matters ("page up")
	std::optional<input::VirtualKeyCode> virtual_keycode;
};

/// @brief The mouse moved since the previous frame
struct MouseDeltaEvent {
	/// Difference in pixels between the mouse location last frame and this frame
	glm::dvec2 delta;
};

/// @brief The window changed size
///
/// Also raised once when a Context starts running its scene.
struct WindowResizeEvent {
	glm::uvec2 new_size;
};

/// @brief The common event handlers of a scene
///
/// Handlers are shared so the driver can dispatch without holding the scene lock.
struct EventHandlers {
	explicit EventHandlers(const std::shared_ptr<ThreadPool>& pool = nullptr, const RetryPolicy& policy = {}) :
	    tick(std::make_shared<EventHandler<TickEvent>>(pool, policy)),
	    key(std::make_shared<EventHandler<KeyboardEvent>>(pool, policy)),
	    mouse_delta(std::make_shared<EventHandler<MouseDeltaEvent>>(pool, policy)),
	    window_resize(std::make_shared<EventHandler<WindowResizeEvent>>(pool, policy)) { }

	std::shared_ptr<EventHandler<TickEvent>> tick;
	std::shared_ptr<EventHandler<KeyboardEvent>> key;
	std::shared_ptr<EventHandler<MouseDeltaEvent>> mouse_delta;
	std::shared_ptr<EventHandler<WindowResizeEvent>> window_resize;
};

}
