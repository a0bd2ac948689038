#include <Ember/Settings.hpp>

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace ember {

namespace {

template<typename T>
void ReadKey(const YAML::Node& node, const char* key, T& out) {
	if (const YAML::Node value = node[key]) {
		out = value.as<T>();
	}
}

Settings FromYaml(const YAML::Node& config) {
	if (!config.IsMap()) {
		throw EmberException("Settings document is not a map");
	}
	if (!config["format"] || config["format"].as<std::string>() != "emberSettings") {
		throw EmberException("Unexpected type for Settings");
	}

	Settings settings;
	ReadKey(config, "workers", settings.workers);

	if (const YAML::Node log = config["log"]) {
		if (const YAML::Node level = log["level"]) {
			settings.logLevel = Log::LevelFromString(level.as<std::string>());
		}
		ReadKey(log, "file", settings.logFile);
	}

	if (const YAML::Node dispatch = config["dispatch"]) {
		ReadKey(dispatch, "maxRetryRounds", settings.dispatch.maxRounds);
		ReadKey(dispatch, "spinRounds", settings.dispatch.spinRounds);
		if (const YAML::Node backoff = dispatch["initialBackoffUs"]) {
			settings.dispatch.initialBackoff = std::chrono::microseconds(backoff.as<int64_t>());
		}
		if (const YAML::Node backoff = dispatch["maxBackoffUs"]) {
			settings.dispatch.maxBackoff = std::chrono::microseconds(backoff.as<int64_t>());
		}
		if (settings.dispatch.initialBackoff.count() < 0 || settings.dispatch.maxBackoff < settings.dispatch.initialBackoff) {
			throw EmberException("dispatch.maxBackoffUs must not be lower than dispatch.initialBackoffUs");
		}
	}

	if (const YAML::Node time = config["time"]) {
		ReadKey(time, "maxDelta", settings.maxDelta);
		ReadKey(time, "stopwatchSamples", settings.stopwatchSamples);
		if (settings.maxDelta < 0.0) {
			throw EmberException("time.maxDelta can't be negative");
		}
		if (settings.stopwatchSamples < 2) {
			throw EmberException("time.stopwatchSamples needs at least 2 samples");
		}
	}

	if (const YAML::Node window = config["window"]) {
		if (const YAML::Node size = window["size"]) {
			if (!size.IsSequence() || size.size() != 2) {
				throw EmberException("window.size must be a [width, height] pair");
			}
			settings.windowSize = { size[0].as<unsigned>(), size[1].as<unsigned>() };
		}
	}

	return settings;
}

}

Settings Settings::Load(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw EmberException(std::format("Couldn't open settings file \"{0}\"", path.string()));
	}
	std::stringstream buffer;
	buffer << file.rdbuf();

	EMBER_INFO("Loading settings from {0}", path.string());
	return Parse(buffer.str());
}

Settings Settings::Parse(std::string_view text) {
	try {
		return FromYaml(YAML::Load(std::string(text)));
	} catch (const YAML::Exception& e) {
		throw EmberException(std::format("Invalid settings document: {0}", e.what()));
	}
}

}
