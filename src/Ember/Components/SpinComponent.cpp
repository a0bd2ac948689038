#include <Ember/Components/SpinComponent.hpp>
#include <Ember/Event/LockData.hpp>
#include <Ember/Log.hpp>
#include <Ember/Objects/Scene.hpp>

namespace ember {

namespace {

struct SpinData {
	event::Write<SpinComponent> spin;
	event::Write<Node> node;

	EMBER_CAPABILITIES(spin, node)
};

}

Strong<SpinComponent> SpinComponent::Attach(const Strong<Node>& node, const glm::vec3& axis, float speed) {
	auto component = MakeShared<SpinComponent>(node, axis, speed);
	auto data = MakeShared<SpinData>(component, node);

	auto scene = node->Read()->scene().lock();
	if (!scene) {
		throw EmberException("Attached SpinComponent to a node that is not in a scene");
	}
	const event::EventHandlers handlers = scene->Read()->events();

	event::Listen(data, *handlers.tick, [](const event::TickEvent& e, SpinComponent& self, Node& target) {
		const float step = self.m_speed * static_cast<float>(e.delta);
		target.Rotate(self.m_axis, step);
		self.m_angle += step;
	});

	node->Write()->AddComponent(component);
	return component;
}

}
