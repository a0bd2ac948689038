#include <Ember/Components/TickDebugComponent.hpp>
#include <Ember/Components/ViewportComponent.hpp>
#include <Ember/Context.hpp>
#include <Ember/Event/LockData.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace ember;
using namespace ember::event;
using namespace std::chrono_literals;

namespace {

using Journal = std::vector<std::string>;

struct JournalData {
	Write<Journal> journal;

	EMBER_CAPABILITIES(journal)
};

Settings TestSettings() {
	Settings settings;
	settings.workers = 2;
	settings.maxDelta = 0.0;
	settings.windowSize = { 640, 480 };
	return settings;
}

}

TEST(Context, CountsFrames) {
	Context context(TestSettings());
	EXPECT_EQ(context.frame(), 0u);

	context.RunFrames(3);
	EXPECT_EQ(context.frame(), 3u);

	context.BeginFrame();
	EXPECT_EQ(context.frame(), 3u);
	context.EndFrame();
	EXPECT_EQ(context.frame(), 4u);
}

TEST(Context, FramesAreCountedPerContext) {
	Context first(TestSettings());
	Context second(TestSettings());

	first.RunFrames(5);
	second.RunFrames(1);
	EXPECT_EQ(first.frame(), 5u);
	EXPECT_EQ(second.frame(), 1u);
}

TEST(Context, FirstFrameReportsTheWindowSize) {
	Context context(TestSettings());
	auto node = context.scene()->Write()->NewNode("Camera");
	auto viewport = ViewportComponent::Attach(node);

	context.RunFrames(3);
	EXPECT_EQ(viewport->Read()->resize_count(), 1u);
	EXPECT_EQ(viewport->Read()->extent(), glm::uvec2(640, 480));
}

TEST(Context, HostResizeReplacesTheInitialOne) {
	Context context(TestSettings());
	auto node = context.scene()->Write()->NewNode("Camera");
	auto viewport = ViewportComponent::Attach(node);

	context.ProcessWindowResizeEvent({ glm::uvec2(1024, 768) });
	context.RunFrames(2);
	EXPECT_EQ(viewport->Read()->resize_count(), 1u);
	EXPECT_EQ(viewport->Read()->extent(), glm::uvec2(1024, 768));
}

TEST(Context, FrameActionOrder) {
	Context context(TestSettings());
	auto journal = MakeShared<Journal>();

	Listen(MakeShared<JournalData>(journal), *context.scene()->Read()->events().tick, [](const TickEvent&, Journal& j) {
		j.push_back("tick");
	});

	context.QueuePostFrame([journal] {
		journal->Write()->push_back("post");
	});
	context.QueuePreFrame([&context, journal] {
		journal->Write()->push_back("pre");
		// Runs with the next frame, not this one
		context.QueuePreFrame([journal] {
			journal->Write()->push_back("next pre");
		});
	});

	context.BeginFrame();
	context.EndFrame();
	EXPECT_EQ(*journal->Read(), (Journal { "pre", "tick", "post" }));

	context.RunFrames(1);
	EXPECT_EQ(*journal->Read(), (Journal { "pre", "tick", "post", "next pre", "tick" }));
}

TEST(Context, TickCarriesTheFrameDelta) {
	Context context(TestSettings());
	auto deltas = MakeShared<std::vector<double>>();

	struct DeltaData {
		Write<std::vector<double>> deltas;

		EMBER_CAPABILITIES(deltas)
	};
	Listen(MakeShared<DeltaData>(deltas), *context.scene()->Read()->events().tick, [](const TickEvent& e, std::vector<double>& d) {
		d.push_back(e.delta);
	});

	const auto start = Time::clock_t::now();
	context.BeginFrame(start + 1s);
	context.EndFrame();
	context.time().scale(2.0);
	context.BeginFrame(start + 1250ms);
	context.EndFrame();

	auto d = deltas->Read();
	ASSERT_EQ(d->size(), 2u);
	EXPECT_DOUBLE_EQ(d->at(1), 0.5);
	EXPECT_DOUBLE_EQ(context.time().raw_delta(), 0.25);
}

TEST(Context, ForwardsInput) {
	Context context(TestSettings());
	auto node = context.scene()->Write()->NewNode();
	auto debug = TickDebugComponent::Attach(node);

	context.BeginFrame();
	context.ProcessKeyboardEvent({ 57, input::ElementState::Pressed, input::VirtualKeyCode::Space });
	context.EndFrame();

	EXPECT_EQ(debug->Read()->tick_count(), 1u);
	EXPECT_EQ(debug->Read()->key_presses(), 1u);
	EXPECT_EQ(debug->Read()->last_key(), input::VirtualKeyCode::Space);
}
