/**
 * @file Settings.hpp
 * @brief Engine configuration, loaded from a YAML document
 */

#pragma once

#include <Ember/Event/RetryPolicy.hpp>
#include <Ember/Log.hpp>
#include <filesystem>
#include <glm/glm.hpp>
#include <string>
#include <string_view>

namespace ember {

/// @brief Everything a Context needs to start
///
/// A settings file looks like this, every key but @c format is optional and
/// keeps its default when missing:
/// @code{.yaml}
/// format: emberSettings
/// workers: 4
/// log:
///   level: info
///   file: ember.log
/// dispatch:
///   maxRetryRounds: 64
///   spinRounds: 8
///   initialBackoffUs: 50
///   maxBackoffUs: 1000
/// time:
///   maxDelta: 0.25
///   stopwatchSamples: 512
/// window:
///   size: [1280, 720]
/// @endcode
struct Settings final {
	/// Worker threads of the dispatch pool, 0 uses the hardware concurrency
	size_t workers = 0;

	Log::Level logLevel = Log::Info;

	/// Log file next to the console output, empty for console only
	std::string logFile;

	event::RetryPolicy dispatch;

	/// Upper bound of the tick delta in seconds, 0 disables it
	double maxDelta = 0.25;

	size_t stopwatchSamples = 512;

	/// Extent reported by the first WindowResizeEvent
	glm::uvec2 windowSize { 1280, 720 };

	/// @brief Reads and parses a settings file
	/// @throws EmberException if the file can't be read or is not a valid settings document
	static Settings Load(const std::filesystem::path& path);

	/// @brief Parses a settings document
	/// @throws EmberException if the document is not valid YAML or not a settings document
	static Settings Parse(std::string_view text);
};

}
