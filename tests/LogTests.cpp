#include <Ember/Log.hpp>
#include <gtest/gtest.h>
#include <string>

using namespace ember;

TEST(Log, LevelNames) {
	EXPECT_EQ(Log::LevelFromString("trace"), Log::Trace);
	EXPECT_EQ(Log::LevelFromString("warn"), Log::Warning);
	EXPECT_EQ(Log::LevelFromString("warning"), Log::Warning);
	EXPECT_EQ(Log::LevelFromString("off"), Log::Off);
	EXPECT_THROW((void)Log::LevelFromString("verbose"), EmberException);
}

TEST(Log, ChannelsHaveTheirOwnLevel) {
	const Log::Level engine = Log::GetLevel(Log::Channel::Engine);
	const Log::Level client = Log::GetLevel(Log::Channel::Client);

	Log::ChangeLevel(Log::Channel::Engine, Log::Error);
	Log::ChangeLevel(Log::Channel::Client, Log::Trace);
	EXPECT_EQ(Log::GetLevel(Log::Channel::Engine), Log::Error);
	EXPECT_EQ(Log::GetLevel(Log::Channel::Client), Log::Trace);

	EMBER_INFO("dropped {0}", 1);
	CLIENT_INFO("kept {0}", 2);

	Log::ChangeLevel(Log::Channel::Engine, engine);
	Log::ChangeLevel(Log::Channel::Client, client);
}

TEST(Log, ExceptionCarriesItsLocation) {
	try {
		throw EmberException("broken");
	} catch (const EmberException& e) {
		const std::string what = e.what();
		EXPECT_NE(what.find("broken"), std::string::npos);
		EXPECT_NE(what.find("LogTests.cpp"), std::string::npos);
	}
}
