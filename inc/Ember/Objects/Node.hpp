/// @file Node.hpp
/// @brief The root of anything that is in a scene

#pragma once

#include <Ember/Components/Component.hpp>
#include <Ember/Event/Shared.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace ember {

class Scene;

/// @class ember::Node
/// @brief Something in the scene, with a transform and a list of components
///
/// Nodes always live in a Shared<Node> owned by their Scene, create them with
/// Scene::NewNode(). The node owns its components, listeners and components
/// only ever hold weak references to the node.
class Node {
public:
	/// @note Use Scene::NewNode() instead
	Node(Weak<Scene> scene, std::string name);

	Node(const Node&) = delete;
	Node& operator=(const Node&) = delete;

	[[nodiscard]]
	const Weak<Scene>& scene() const noexcept {
		return m_scene;
	}

	/// Weak reference to the cell holding this node
	[[nodiscard]]
	const Weak<Node>& self() const noexcept {
		return m_self;
	}

	[[nodiscard]]
	const std::string& name() const noexcept {
		return m_name;
	}

	void name(std::string name) noexcept {
		m_name = std::move(name);
	}

#pragma region Transform

	[[nodiscard]]
	const glm::vec3& position() const noexcept {
		return m_position;
	}

	void position(const glm::vec3& position) noexcept {
		m_position = position;
	}

	[[nodiscard]]
	const glm::quat& rotation() const noexcept {
		return m_rotation;
	}

	void rotation(const glm::quat& rotation) noexcept {
		m_rotation = rotation;
	}

	[[nodiscard]]
	const glm::vec3& scale() const noexcept {
		return m_scale;
	}

	void scale(const glm::vec3& scale) noexcept {
		m_scale = scale;
	}

	void Translate(const glm::vec3& offset) noexcept;

	/// @brief Rotates the node by @p angle radians around @p axis
	void Rotate(const glm::vec3& axis, float angle) noexcept;

	/// @brief Translation * rotation * scale of this node
	[[nodiscard]]
	glm::mat4 transform() const noexcept;

#pragma endregion

#pragma region Components

	/// @brief Hands ownership of a component to the node
	template<ComponentType T>
	void AddComponent(Strong<T> component) {
		m_components.push_back({ typeid(T), T::static_type(), std::move(component) });
	}

	/// @brief Returns the first component of type T, or null
	template<ComponentType T>
	[[nodiscard]]
	Strong<T> GetComponent() const {
		for (const auto& entry : m_components) {
			if (entry.type == typeid(T)) {
				return std::static_pointer_cast<Shared<T>>(entry.cell);
			}
		}
		return nullptr;
	}

	/// @brief Drops every component of type T
	/// @return How many components were dropped
	template<ComponentType T>
	size_t RemoveComponents() {
		return std::erase_if(m_components, [](const ComponentEntry& entry) {
			return entry.type == typeid(T);
		});
	}

	[[nodiscard]]
	size_t component_count() const noexcept {
		return m_components.size();
	}

	/// @brief Names of the attached components, in attach order
	[[nodiscard]]
	std::vector<const char*> component_names() const;

#pragma endregion

private:
	friend class Scene;

	struct ComponentEntry {
		std::type_index type;
		const char* name;
		std::shared_ptr<void> cell;
	};

	Weak<Node> m_self;
	Weak<Scene> m_scene;
	std::string m_name;

	glm::vec3 m_position { 0.0f };
	glm::quat m_rotation { 1.0f, 0.0f, 0.0f, 0.0f };
	glm::vec3 m_scale { 1.0f };

	/// Ordered list of the components this node owns
	std::vector<ComponentEntry> m_components;
};

}
