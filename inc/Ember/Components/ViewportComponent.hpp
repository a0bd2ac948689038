/// @file ViewportComponent.hpp
/// @brief Keeps track of the window extent, cameras read their aspect ratio from it

#pragma once

#include <Ember/Components/Component.hpp>
#include <Ember/Event/Shared.hpp>
#include <glm/glm.hpp>

namespace ember {

class Node;

class ViewportComponent {
public:
	EMBER_COMPONENT(ViewportComponent)

	explicit ViewportComponent(Weak<Node> node) : m_node(std::move(node)) { }

	/// @throws EmberException if the node is not part of a scene
	static Strong<ViewportComponent> Attach(const Strong<Node>& node);

	[[nodiscard]]
	const glm::uvec2& extent() const noexcept {
		return m_extent;
	}

	/// Width over height, 0 until the first resize or while minimized
	[[nodiscard]]
	float aspect() const noexcept {
		return m_aspect;
	}

	[[nodiscard]]
	unsigned resize_count() const noexcept {
		return m_resizes;
	}

private:
	Weak<Node> m_node;
	glm::uvec2 m_extent { 0u };
	float m_aspect = 0.0f;
	unsigned m_resizes = 0;
};

}
