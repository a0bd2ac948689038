#include <Ember/Components/ViewportComponent.hpp>
#include <Ember/Event/LockData.hpp>
#include <Ember/Log.hpp>
#include <Ember/Objects/Scene.hpp>

namespace ember {

namespace {

struct ViewportData {
	event::Write<ViewportComponent> viewport;

	EMBER_CAPABILITIES(viewport)
};

}

Strong<ViewportComponent> ViewportComponent::Attach(const Strong<Node>& node) {
	auto component = MakeShared<ViewportComponent>(node);
	auto data = MakeShared<ViewportData>(component);

	auto scene = node->Read()->scene().lock();
	if (!scene) {
		throw EmberException("Attached ViewportComponent to a node that is not in a scene");
	}
	const event::EventHandlers handlers = scene->Read()->events();

	event::Listen(data, *handlers.window_resize, [](const event::WindowResizeEvent& e, ViewportComponent& self) {
		self.m_extent = e.new_size;
		// A minimized window reports a zero height
		self.m_aspect = e.new_size.y == 0 ? 0.0f : static_cast<float>(e.new_size.x) / static_cast<float>(e.new_size.y);
		++self.m_resizes;
	});

	node->Write()->AddComponent(component);
	return component;
}

}
