#include <Ember/Log.hpp>
#include <Ember/Objects/Scene.hpp>
#include <algorithm>
#include <format>

namespace ember {

Strong<Scene> Scene::Create(std::shared_ptr<ThreadPool> pool, const event::RetryPolicy& policy) {
	auto scene = MakeShared<Scene>(pool, policy);
	scene->Write()->m_self = scene;
	return scene;
}

Scene::Scene(const std::shared_ptr<ThreadPool>& pool, const event::RetryPolicy& policy) : m_events(pool, policy) { }

Strong<Node> Scene::NewNode(std::string name) {
	const unsigned id = m_nextNodeId++;
	if (name.empty()) {
		name = std::format("Node_{0}", id);
	}

	auto node = MakeShared<Node>(m_self, std::move(name));
	node->Write()->m_self = node;
	m_nodes.push_back(node);
	return node;
}

bool Scene::RemoveNode(const Strong<Node>& node) {
	auto it = std::ranges::find(m_nodes, node);
	if (it == m_nodes.end()) {
		EMBER_WARN("Tried to remove a node that is not part of the scene");
		return false;
	}
	m_nodes.erase(it);
	return true;
}

Strong<Node> Scene::FindNode(std::string_view name) const {
	for (const auto& node : m_nodes) {
		if (node->Read()->name() == name) {
			return node;
		}
	}
	return nullptr;
}

}
