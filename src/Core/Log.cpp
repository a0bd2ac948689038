// src/Core/Log.cpp
#include <Ember/Log.hpp>

// clang-format off
// private: spdlog includes
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <vector>
// clang-format on

namespace ember {

// private statics (file-local)
static std::shared_ptr<spdlog::logger> s_engineLogger;
static std::shared_ptr<spdlog::logger> s_clientLogger;
static std::mutex s_initMutex;

static spdlog::level::level_enum ToSpdLevel(Log::Level lvl) {
	switch (lvl) {
		case Log::Level::Trace: return spdlog::level::trace;
		case Log::Level::Info: return spdlog::level::info;
		case Log::Level::Warning: return spdlog::level::warn;
		case Log::Level::Error: return spdlog::level::err;
		case Log::Level::Critical: return spdlog::level::critical;
		case Log::Level::Off: return spdlog::level::off;
	}
	return spdlog::level::info;
}

static void InitLocked(std::string_view file_path) {
	// Listeners log from the worker threads, so every sink is the _mt flavour
	std::vector<spdlog::sink_ptr> sinks;

	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	console_sink->set_pattern("%^[%n] %v%$");
	sinks.push_back(console_sink);

	if (!file_path.empty()) {
		auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string(file_path), true);
		file_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] [%t] [%n] %v");
		sinks.push_back(file_sink);
	}

	if (s_engineLogger) {
		spdlog::drop(s_engineLogger->name());
	}
	if (s_clientLogger) {
		spdlog::drop(s_clientLogger->name());
	}

	// engine logger
	s_engineLogger = std::make_shared<spdlog::logger>("EMBER", sinks.begin(), sinks.end());
	s_engineLogger->set_level(spdlog::level::trace);
	spdlog::register_logger(s_engineLogger);

	// client logger
	s_clientLogger = std::make_shared<spdlog::logger>("GAME", sinks.begin(), sinks.end());
	s_clientLogger->set_level(spdlog::level::trace);
	spdlog::register_logger(s_clientLogger);
}

void Log::Init(std::string_view file_path) {
	std::lock_guard lock(s_initMutex);
	InitLocked(file_path);
}

static std::shared_ptr<spdlog::logger> Logger(Log::Channel channel) {
	std::lock_guard lock(s_initMutex);
	if (!s_engineLogger || !s_clientLogger) {
		InitLocked({});
	}
	return channel == Log::Channel::Engine ? s_engineLogger : s_clientLogger;
}

void Log::Write(Channel channel, Level lvl, std::string_view msg) {
	Logger(channel)->log(ToSpdLevel(lvl), "{}", msg);
}

void Log::ChangeLevel(Channel channel, Level lvl) {
	Logger(channel)->set_level(ToSpdLevel(lvl));
}

Log::Level Log::GetLevel(Channel channel) {
	switch (Logger(channel)->level()) {
		case spdlog::level::trace:
		case spdlog::level::debug: return Trace;
		case spdlog::level::info: return Info;
		case spdlog::level::warn: return Warning;
		case spdlog::level::err: return Error;
		case spdlog::level::critical: return Critical;
		default: return Off;
	}
}

Log::Level Log::LevelFromString(std::string_view name) {
	if (name == "trace") {
		return Trace;
	}
	if (name == "info") {
		return Info;
	}
	if (name == "warning" || name == "warn") {
		return Warning;
	}
	if (name == "error") {
		return Error;
	}
	if (name == "critical") {
		return Critical;
	}
	if (name == "off") {
		return Off;
	}
	throw EmberException(std::format("Unknown log level \"{0}\"", name));
}

}
