#include <Ember/Components/MouseLookComponent.hpp>
#include <Ember/Event/LockData.hpp>
#include <Ember/Log.hpp>
#include <Ember/Objects/Scene.hpp>
#include <algorithm>
#include <glm/gtc/quaternion.hpp>

namespace ember {

namespace {

struct MouseLookData {
	event::Write<MouseLookComponent> look;
	event::Write<Node> node;

	EMBER_CAPABILITIES(look, node)
};

}

Strong<MouseLookComponent> MouseLookComponent::Attach(const Strong<Node>& node, double sensitivity) {
	auto component = MakeShared<MouseLookComponent>(node, sensitivity);
	auto data = MakeShared<MouseLookData>(component, node);

	auto scene = node->Read()->scene().lock();
	if (!scene) {
		throw EmberException("Attached MouseLookComponent to a node that is not in a scene");
	}
	const event::EventHandlers handlers = scene->Read()->events();

	event::Listen(data, *handlers.mouse_delta, [](const event::MouseDeltaEvent& e, MouseLookComponent& self, Node& target) {
		self.m_yaw -= e.delta.x * self.m_sensitivity;
		self.m_pitch = std::clamp(self.m_pitch - e.delta.y * self.m_sensitivity, -MAX_PITCH, MAX_PITCH);
		target.rotation(glm::quat(glm::vec3(static_cast<float>(self.m_pitch), static_cast<float>(self.m_yaw), 0.0f)));
	});

	node->Write()->AddComponent(component);
	return component;
}

}
