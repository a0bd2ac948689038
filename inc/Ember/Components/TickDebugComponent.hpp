/// @file TickDebugComponent.hpp
/// @brief Counts frames and key presses, useful to check a scene is alive

#pragma once

#include <Ember/Components/Component.hpp>
#include <Ember/Event/Shared.hpp>
#include <Ember/Input/KeyCodes.hpp>
#include <optional>

namespace ember {

class Node;

class TickDebugComponent {
public:
	EMBER_COMPONENT(TickDebugComponent)

	explicit TickDebugComponent(Weak<Node> node) : m_node(std::move(node)) { }

	/// @brief Creates the component, subscribes it to tick and key events and gives it to @p node
	/// @throws EmberException if the node is not part of a scene
	static Strong<TickDebugComponent> Attach(const Strong<Node>& node);

	[[nodiscard]]
	unsigned tick_count() const noexcept {
		return m_ticks;
	}

	[[nodiscard]]
	unsigned key_presses() const noexcept {
		return m_keyPresses;
	}

	[[nodiscard]]
	std::optional<input::VirtualKeyCode> last_key() const noexcept {
		return m_lastKey;
	}

	[[nodiscard]]
	const Weak<Node>& node() const noexcept {
		return m_node;
	}

private:
	Weak<Node> m_node;
	unsigned m_ticks = 0;
	unsigned m_keyPresses = 0;
	std::optional<input::VirtualKeyCode> m_lastKey;
};

}
