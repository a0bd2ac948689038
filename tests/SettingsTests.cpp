#include <Ember/Settings.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace ember;

TEST(Settings, Defaults) {
	const Settings settings;
	EXPECT_EQ(settings.workers, 0u);
	EXPECT_EQ(settings.logLevel, Log::Info);
	EXPECT_TRUE(settings.logFile.empty());
	EXPECT_EQ(settings.dispatch.maxRounds, 64u);
	EXPECT_EQ(settings.dispatch.spinRounds, 8u);
	EXPECT_EQ(settings.dispatch.initialBackoff.count(), 50);
	EXPECT_EQ(settings.dispatch.maxBackoff.count(), 1000);
	EXPECT_DOUBLE_EQ(settings.maxDelta, 0.25);
	EXPECT_EQ(settings.stopwatchSamples, 512u);
	EXPECT_EQ(settings.windowSize, glm::uvec2(1280, 720));
}

TEST(Settings, ParseEveryKey) {
	const Settings settings = Settings::Parse(R"(
format: emberSettings
workers: 3
log:
  level: warning
  file: ember.log
dispatch:
  maxRetryRounds: 10
  spinRounds: 2
  initialBackoffUs: 20
  maxBackoffUs: 400
time:
  maxDelta: 0.1
  stopwatchSamples: 64
window:
  size: [1920, 1080]
)");

	EXPECT_EQ(settings.workers, 3u);
	EXPECT_EQ(settings.logLevel, Log::Warning);
	EXPECT_EQ(settings.logFile, "ember.log");
	EXPECT_EQ(settings.dispatch.maxRounds, 10u);
	EXPECT_EQ(settings.dispatch.spinRounds, 2u);
	EXPECT_EQ(settings.dispatch.initialBackoff.count(), 20);
	EXPECT_EQ(settings.dispatch.maxBackoff.count(), 400);
	EXPECT_DOUBLE_EQ(settings.maxDelta, 0.1);
	EXPECT_EQ(settings.stopwatchSamples, 64u);
	EXPECT_EQ(settings.windowSize, glm::uvec2(1920, 1080));
}

TEST(Settings, MissingKeysKeepDefaults) {
	const Settings settings = Settings::Parse("format: emberSettings\nworkers: 2\n");
	EXPECT_EQ(settings.workers, 2u);
	EXPECT_EQ(settings.dispatch.maxRounds, 64u);
	EXPECT_EQ(settings.windowSize, glm::uvec2(1280, 720));
}

TEST(Settings, RejectsOtherDocuments) {
	EXPECT_THROW(Settings::Parse(""), EmberException);
	EXPECT_THROW(Settings::Parse("workers: 2\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: projectData\n"), EmberException);
	EXPECT_THROW(Settings::Parse("- format\n- emberSettings\n"), EmberException);
}

TEST(Settings, RejectsBadValues) {
	EXPECT_THROW(Settings::Parse("format: emberSettings\nworkers: [1, 2\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: emberSettings\nworkers: many\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: emberSettings\nlog:\n  level: loud\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: emberSettings\nwindow:\n  size: [1920]\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: emberSettings\ntime:\n  stopwatchSamples: 1\n"), EmberException);
	EXPECT_THROW(Settings::Parse("format: emberSettings\ndispatch:\n  initialBackoffUs: 500\n  maxBackoffUs: 100\n"), EmberException);
}

TEST(Settings, LoadFromFile) {
	const auto path = std::filesystem::temp_directory_path() / "ember_settings_test.yaml";
	{
		std::ofstream file(path);
		file << "format: emberSettings\n"
		        "window:\n"
		        "  size: [800, 600]\n";
	}

	const Settings settings = Settings::Load(path);
	EXPECT_EQ(settings.windowSize, glm::uvec2(800, 600));
	std::filesystem::remove(path);

	EXPECT_THROW(Settings::Load(path), EmberException);
}
