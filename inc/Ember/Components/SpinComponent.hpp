/// @file SpinComponent.hpp
/// @brief Rotates its node at a constant speed

#pragma once

#include <Ember/Components/Component.hpp>
#include <Ember/Event/Shared.hpp>
#include <glm/glm.hpp>

namespace ember {

class Node;

class SpinComponent {
public:
	EMBER_COMPONENT(SpinComponent)

	SpinComponent(Weak<Node> node, const glm::vec3& axis, float speed) : m_node(std::move(node)), m_axis(axis), m_speed(speed) { }

	/// @brief Makes @p node spin around @p axis at @p speed radians per second
	/// @throws EmberException if the node is not part of a scene
	static Strong<SpinComponent> Attach(const Strong<Node>& node, const glm::vec3& axis, float speed);

	[[nodiscard]]
	const glm::vec3& axis() const noexcept {
		return m_axis;
	}

	[[nodiscard]]
	float speed() const noexcept {
		return m_speed;
	}

	void speed(float speed) noexcept {
		m_speed = speed;
	}

	/// Total angle applied to the node so far, in radians
	[[nodiscard]]
	double angle() const noexcept {
		return m_angle;
	}

private:
	Weak<Node> m_node;
	glm::vec3 m_axis;
	float m_speed;
	double m_angle = 0.0;
};

}
