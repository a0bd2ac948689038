#include <Ember/Context.hpp>
#include <Ember/Log.hpp>
#include <Ember/Profiler.hpp>

namespace ember {

Context::Context(const Settings& settings) :
    m_settings(settings),
    m_pool(std::make_shared<ThreadPool>()),
    m_time(settings.stopwatchSamples, settings.maxDelta) {
	if (!m_settings.logFile.empty()) {
		Log::Init(m_settings.logFile);
	}
	Log::ChangeLevel(Log::Channel::Engine, m_settings.logLevel);
	Log::ChangeLevel(Log::Channel::Client, m_settings.logLevel);

	m_pool->Init(m_settings.workers);
	m_scene = Scene::Create(m_pool, m_settings.dispatch);

	EMBER_INFO("Context started with {0} dispatch workers", m_pool->size());
}

Context::~Context() {
	{
		std::lock_guard lock(m_preFrameMutex);
		if (!m_preFrame.empty()) {
			EMBER_WARN("Context was deleted with {0} pre-frame actions on the queue", m_preFrame.size());
		}
	}

	// Components go before the workers that could still reference them
	m_scene.reset();
	m_pool->Destroy();
}

void Context::BeginFrame() {
	BeginFrame(Time::clock_t::now());
}

void Context::BeginFrame(Time::time_point_t now) {
	EMBER_PROFILE_ZONE_N("Context::BeginFrame");

	RunQueue(m_preFrameMutex, m_preFrame);

	if (!m_started) {
		m_started = true;
		if (!m_resized) {
			ProcessWindowResizeEvent({ m_settings.windowSize });
		}
	}

	m_time.Tick(now);
	handlers().tick->Handle(event::TickEvent { m_time.delta() });
}

void Context::EndFrame() {
	EMBER_PROFILE_ZONE_N("Context::EndFrame");

	RunQueue(m_postFrameMutex, m_postFrame);
	++m_frame;

	EMBER_PROFILE_FRAME;
}

void Context::RunFrames(unsigned count) {
	for (unsigned i = 0; i < count; i++) {
		BeginFrame();
		EndFrame();
	}
}

void Context::ProcessKeyboardEvent(const event::KeyboardEvent& event) {
	handlers().key->Handle(event);
}

void Context::ProcessMouseDeltaEvent(const event::MouseDeltaEvent& event) {
	handlers().mouse_delta->Handle(event);
}

void Context::ProcessWindowResizeEvent(const event::WindowResizeEvent& event) {
	m_resized = true;
	EMBER_TRACE("Window resized to {0}x{1}", event.new_size.x, event.new_size.y);
	handlers().window_resize->Handle(event);
}

void Context::QueuePreFrame(std::function<void()> action) {
	std::lock_guard lock(m_preFrameMutex);
	m_preFrame.push_back(std::move(action));
}

void Context::QueuePostFrame(std::function<void()> action) {
	std::lock_guard lock(m_postFrameMutex);
	m_postFrame.push_back(std::move(action));
}

void Context::RunQueue(std::mutex& mutex, std::vector<std::function<void()>>& queue) {
	// Swap under the lock so actions can queue more actions for the next frame
	std::vector<std::function<void()>> local_queue;
	{
		std::lock_guard lock(mutex);
		if (queue.empty()) {
			return;
		}
		local_queue.swap(queue);
	}

	for (auto& action : local_queue) {
		if (action) {
			action();
		}
	}
}

event::EventHandlers Context::handlers() const {
	return m_scene->Read()->events();
}

}
