#include <Ember/Components/TickDebugComponent.hpp>
#include <Ember/Event/LockData.hpp>
#include <Ember/Log.hpp>
#include <Ember/Objects/Scene.hpp>

namespace ember {

namespace {

struct TickDebugData {
	event::Write<TickDebugComponent> component;

	EMBER_CAPABILITIES(component)
};

}

Strong<TickDebugComponent> TickDebugComponent::Attach(const Strong<Node>& node) {
	auto component = MakeShared<TickDebugComponent>(node);
	auto data = MakeShared<TickDebugData>(component);

	auto scene = node->Read()->scene().lock();
	if (!scene) {
		throw EmberException("Attached TickDebugComponent to a node that is not in a scene");
	}
	const event::EventHandlers handlers = scene->Read()->events();

	event::Listen(data, *handlers.tick, [](const event::TickEvent&, TickDebugComponent& self) {
		++self.m_ticks;
	});

	event::Listen(data, *handlers.key, [](const event::KeyboardEvent& e, TickDebugComponent& self) {
		if (e.state != input::ElementState::Pressed) {
			return;
		}
		++self.m_keyPresses;
		self.m_lastKey = e.virtual_keycode;
		EMBER_TRACE(
		    "Key {0} pressed (scan code {1}) after {2} ticks",
		    e.virtual_keycode ? input::KeyName(*e.virtual_keycode) : "unknown",
		    e.scan_code,
		    self.m_ticks
		);
	});

	node->Write()->AddComponent(component);
	return component;
}

}
