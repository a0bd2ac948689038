/// @file Component.hpp
/// @brief What a type needs to be attached to a Node

#pragma once

#include <concepts>

/// @def EMBER_COMPONENT(CLASS)
/// Gives a component the name it is reported under in logs
#define EMBER_COMPONENT(CLASS)               \
	[[nodiscard]]                              \
	static constexpr const char* static_type() { \
		return #CLASS;                           \
	}

namespace ember {

/// @brief A type that can be owned by a Node
///
/// Components react to events through listeners (see event::Listen). They
/// usually keep a Weak<Node> back to their node, never a Strong one, and
/// provide a static Attach(const Strong<Node>&) that creates the component,
/// subscribes its listeners and hands it to the node.
template<typename T>
concept ComponentType = requires {
	{ T::static_type() } -> std::convertible_to<const char*>;
};

}
