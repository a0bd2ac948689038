#include <Ember/Objects/Node.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace ember {

Node::Node(Weak<Scene> scene, std::string name) : m_scene(std::move(scene)), m_name(std::move(name)) { }

void Node::Translate(const glm::vec3& offset) noexcept {
	m_position += offset;
}

void Node::Rotate(const glm::vec3& axis, float angle) noexcept {
	if (glm::dot(axis, axis) == 0.0f) {
		return;
	}
	m_rotation = glm::normalize(glm::angleAxis(angle, glm::normalize(axis)) * m_rotation);
}

glm::mat4 Node::transform() const noexcept {
	glm::mat4 xform = glm::translate(glm::mat4(1.0f), m_position);
	xform *= glm::mat4_cast(m_rotation);
	return glm::scale(xform, m_scale);
}

std::vector<const char*> Node::component_names() const {
	std::vector<const char*> names;
	names.reserve(m_components.size());
	for (const auto& entry : m_components) {
		names.push_back(entry.name);
	}
	return names;
}

}
