/**
 * @file Context.hpp
 * @brief Drives the frames of a scene and forwards host input to it
 */

#pragma once

#include <Ember/Event/Events.hpp>
#include <Ember/Objects/Scene.hpp>
#include <Ember/Settings.hpp>
#include <Ember/ThreadPool.hpp>
#include <Ember/Time.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace ember {

/// @class ember::Context
/// @brief Owns a scene, the pool its events are dispatched on, and the frame clock
///
/// The host calls BeginFrame() and EndFrame() around whatever it renders, and
/// forwards window input with the Process*() functions in between. Those calls
/// come from one thread. QueuePreFrame() and QueuePostFrame() can be called
/// from anywhere, listeners included.
///
/// @code
/// ember::Context context(ember::Settings::Load("settings.yaml"));
/// auto node = context.scene()->Write()->NewNode("Camera");
/// ember::MouseLookComponent::Attach(node);
///
/// while (running) {
///     context.BeginFrame();
///     context.ProcessMouseDeltaEvent({ mouse_delta });
///     context.EndFrame();
/// }
/// @endcode
class Context {
public:
	explicit Context(const Settings& settings = {});
	~Context();

	Context(const Context&) = delete;
	Context& operator=(const Context&) = delete;

	/// @brief Runs the pre-frame actions, ticks the clock and dispatches a TickEvent
	///
	/// The first frame also dispatches a WindowResizeEvent with the configured
	/// window size, unless the host already reported one.
	void BeginFrame();

	/// @brief Same as BeginFrame() with an explicit timestamp for the clock
	void BeginFrame(Time::time_point_t now);

	/// @brief Runs the post-frame actions and closes the frame
	void EndFrame();

	/// @brief Runs @p count full frames back to back
	void RunFrames(unsigned count);

	void ProcessKeyboardEvent(const event::KeyboardEvent& event);
	void ProcessMouseDeltaEvent(const event::MouseDeltaEvent& event);
	void ProcessWindowResizeEvent(const event::WindowResizeEvent& event);

	/// @brief Runs @p action at the start of the next frame, before the tick
	void QueuePreFrame(std::function<void()> action);

	/// @brief Runs @p action at the end of the current frame
	void QueuePostFrame(std::function<void()> action);

	/// Number of frames that went through EndFrame()
	[[nodiscard]]
	uint64_t frame() const noexcept {
		return m_frame;
	}

	[[nodiscard]]
	const Time& time() const noexcept {
		return m_time;
	}

	[[nodiscard]]
	Time& time() noexcept {
		return m_time;
	}

	[[nodiscard]]
	const Strong<Scene>& scene() const noexcept {
		return m_scene;
	}

	[[nodiscard]]
	const std::shared_ptr<ThreadPool>& pool() const noexcept {
		return m_pool;
	}

	[[nodiscard]]
	const Settings& settings() const noexcept {
		return m_settings;
	}

private:
	static void RunQueue(std::mutex& mutex, std::vector<std::function<void()>>& queue);

	/// Copies the handlers out of the scene so nothing holds the scene lock while dispatching
	[[nodiscard]]
	event::EventHandlers handlers() const;

	Settings m_settings;
	std::shared_ptr<ThreadPool> m_pool;
	Strong<Scene> m_scene;
	Time m_time;

	uint64_t m_frame = 0;
	bool m_started = false;
	bool m_resized = false;

	std::mutex m_preFrameMutex;
	std::vector<std::function<void()>> m_preFrame;
	std::mutex m_postFrameMutex;
	std::vector<std::function<void()>> m_postFrame;
};

}
