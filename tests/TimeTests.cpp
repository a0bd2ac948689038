#include <Ember/Time.hpp>
#include <gtest/gtest.h>

using namespace ember;
using namespace std::chrono_literals;

TEST(Time, DeltaBetweenTicks) {
	Time time(8);
	const auto start = Time::clock_t::now();

	time.Tick(start + 1s);
	time.Tick(start + 1500ms);
	EXPECT_DOUBLE_EQ(time.raw_delta(), 0.5);
	EXPECT_DOUBLE_EQ(time.delta(), 0.5);
	EXPECT_GE(time.uptime(), 1.5);
}

TEST(Time, DeltaIsScaledThenClamped) {
	Time time(8, 0.1);
	const auto start = Time::clock_t::now();

	time.Tick(start + 1s);
	time.Tick(start + 2s);
	EXPECT_DOUBLE_EQ(time.raw_delta(), 1.0);
	EXPECT_DOUBLE_EQ(time.delta(), 0.1);

	time.scale(0.5);
	time.Tick(start + 2100ms);
	EXPECT_DOUBLE_EQ(time.delta(), 0.05);

	time.scale(0.0);
	time.Tick(start + 3s);
	EXPECT_DOUBLE_EQ(time.delta(), 0.0);
}

TEST(Time, AverageOverTheSampleWindow) {
	Time time(4);
	const auto start = Time::clock_t::now();

	for (int i = 1; i <= 4; i++) {
		time.Tick(start + std::chrono::seconds(i));
	}
	EXPECT_DOUBLE_EQ(time.average_delta(), 1.0);

	// Older frames fall out of the window
	for (int i = 3; i <= 6; i++) {
		time.Tick(start + std::chrono::seconds(2 * i));
	}
	EXPECT_DOUBLE_EQ(time.average_delta(), 2.0);
}

TEST(Time, AtLeastTwoSamples) {
	Time time(0);
	EXPECT_EQ(time.samples(), 2u);

	const auto start = Time::clock_t::now();
	time.Tick(start + 1s);
	time.Tick(start + 3s);
	EXPECT_DOUBLE_EQ(time.average_delta(), 2.0);
}
