/// @file Scene.hpp
/// @brief Everything the user can see or hear, and anything that interacts with that

#pragma once

#include <Ember/Event/Events.hpp>
#include <Ember/Event/Shared.hpp>
#include <Ember/Objects/Node.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ember {

/// @class ember::Scene
/// @brief Owns the nodes of a world and the event handlers they listen on
///
/// Scenes live in a Shared<Scene>, create them with Scene::Create(). The scene
/// is the only strong owner of its nodes: once a node is removed its
/// components die with it and their listeners are dropped by the next event.
///
/// Most of the time the scene should be locked for reading only, the event
/// handlers have their own locks.
class Scene {
public:
	/// @brief Creates an empty scene
	/// @param pool Pool the scene's handlers dispatch on, null for ThreadPool::Global()
	/// @param policy Retry policy of the scene's handlers
	[[nodiscard]]
	static Strong<Scene> Create(std::shared_ptr<ThreadPool> pool = nullptr, const event::RetryPolicy& policy = {});

	/// @note Use Scene::Create() instead
	Scene(const std::shared_ptr<ThreadPool>& pool, const event::RetryPolicy& policy);

	Scene(const Scene&) = delete;
	Scene& operator=(const Scene&) = delete;

	/// @brief Creates a new node and adds it to the scene
	/// @param name Name of the node, "Node_<n>" if empty
	Strong<Node> NewNode(std::string name = {});

	/// @brief Drops the scene's ownership of @p node
	/// @return false if the node is not part of this scene
	bool RemoveNode(const Strong<Node>& node);

	/// @brief First node called @p name, or null
	/// @note Read-locks the nodes, don't call it from a listener that holds one of them
	[[nodiscard]]
	Strong<Node> FindNode(std::string_view name) const;

	[[nodiscard]]
	const std::vector<Strong<Node>>& nodes() const noexcept {
		return m_nodes;
	}

	[[nodiscard]]
	const event::EventHandlers& events() const noexcept {
		return m_events;
	}

	[[nodiscard]]
	const Weak<Scene>& self() const noexcept {
		return m_self;
	}

private:
	Weak<Scene> m_self;
	std::vector<Strong<Node>> m_nodes;
	event::EventHandlers m_events;
	unsigned m_nextNodeId = 0;
};

}
