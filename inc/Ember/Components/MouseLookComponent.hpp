/// @file MouseLookComponent.hpp
/// @brief Turns its node with the mouse, first person style

#pragma once

#include <Ember/Components/Component.hpp>
#include <Ember/Event/Shared.hpp>

namespace ember {

class Node;

/// Yaw follows the horizontal mouse movement, pitch the vertical one. Pitch is
/// clamped short of straight up and down so the view never flips.
class MouseLookComponent {
public:
	EMBER_COMPONENT(MouseLookComponent)

	static constexpr double MAX_PITCH = 1.5533430342749532;    // 89 degrees

	MouseLookComponent(Weak<Node> node, double sensitivity) : m_node(std::move(node)), m_sensitivity(sensitivity) { }

	/// @param sensitivity Radians turned per pixel of mouse movement
	/// @throws EmberException if the node is not part of a scene
	static Strong<MouseLookComponent> Attach(const Strong<Node>& node, double sensitivity = 0.0025);

	[[nodiscard]]
	double yaw() const noexcept {
		return m_yaw;
	}

	[[nodiscard]]
	double pitch() const noexcept {
		return m_pitch;
	}

	[[nodiscard]]
	double sensitivity() const noexcept {
		return m_sensitivity;
	}

private:
	Weak<Node> m_node;
	double m_sensitivity;
	double m_yaw = 0.0;
	double m_pitch = 0.0;
};

}
