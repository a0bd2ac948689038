/// @file   Log.hpp
/// @brief  Engine and client logging on top of spdlog
///
/// Engine code logs with the EMBER_* macros, code built on the engine with the
/// CLIENT_* ones. Both take a std::format string:
/// @code
/// EMBER_WARN("{0} listener(s) still contended", count);
/// @endcode

#pragma once

#include <Ember/Profiler.hpp>
#include <cassert>
#include <exception>
#include <format>
#include <source_location>
#include <string>
#include <string_view>

namespace ember {

class Log {
public:
	enum Level : char {
		Trace = 0,
		Info,
		Warning,
		Error,
		Critical,
		Off
	};

	/// Engine messages go to the "EMBER" logger, client messages to "GAME"
	enum class Channel : char {
		Engine,
		Client
	};

	/// @brief (Re)creates both loggers, they write to the console and optionally to @p file_path
	/// @note Logging before Init() works, it creates console-only loggers on first use
	static void Init(std::string_view file_path = {});

	/// @brief Writes an already formatted line, spdlog stays out of the headers
	static void Write(Channel channel, Level lvl, std::string_view msg);

	template<typename... Args>
	static void Fmt(Channel channel, Level lvl, std::format_string<Args...> fmt, Args&&... args) {
		Write(channel, lvl, std::format(fmt, std::forward<Args>(args)...));
	}

	/// @brief Messages below @p lvl are dropped from now on
	static void ChangeLevel(Channel channel, Level lvl);

	[[nodiscard]]
	static Level GetLevel(Channel channel);

	/// @brief Parses "trace", "info", "warning" (or "warn"), "error", "critical" or "off"
	/// @throws EmberException for anything else
	[[nodiscard]]
	static Level LevelFromString(std::string_view name);
};

}

#pragma region Macros

#define EMBER_DETAIL_LOG(channel, level, color, ...)                     \
	do {                                                                 \
		auto ember_msg_ = std::format(__VA_ARGS__);                      \
		::ember::Log::Write(channel, level, ember_msg_);                 \
		EMBER_PROFILE_MESSAGE_C(ember_msg_.c_str(), ember_msg_.size(), color); \
	} while (0)

#define EMBER_DETAIL_ASSERT(channel, condition, ...)                             \
	do {                                                                         \
		if (!(condition)) {                                                      \
			::ember::Log::Fmt(channel, ::ember::Log::Level::Critical, __VA_ARGS__); \
			assert(condition);                                                   \
		}                                                                        \
	} while (0)

// ---------------------- Engine Macros ----------------------

#define EMBER_ASSERT(condition, ...) EMBER_DETAIL_ASSERT(::ember::Log::Channel::Engine, condition, __VA_ARGS__)
#define EMBER_ERROR(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Engine, ::ember::Log::Error, 0xDC143C, __VA_ARGS__)
#define EMBER_WARN(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Engine, ::ember::Log::Warning, 0xFFD700, __VA_ARGS__)
#define EMBER_INFO(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Engine, ::ember::Log::Info, 0x7CFC00, __VA_ARGS__)
#define EMBER_TRACE(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Engine, ::ember::Log::Trace, 0xC0C0C0, __VA_ARGS__)

// ---------------------- Client macros ----------------------

#define CLIENT_ASSERT(condition, ...) EMBER_DETAIL_ASSERT(::ember::Log::Channel::Client, condition, __VA_ARGS__)
#define CLIENT_ERROR(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Client, ::ember::Log::Error, 0xDC143C, __VA_ARGS__)
#define CLIENT_WARN(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Client, ::ember::Log::Warning, 0xFFD700, __VA_ARGS__)
#define CLIENT_INFO(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Client, ::ember::Log::Info, 0x7CFC00, __VA_ARGS__)
#define CLIENT_TRACE(...) EMBER_DETAIL_LOG(::ember::Log::Channel::Client, ::ember::Log::Trace, 0xC0C0C0, __VA_ARGS__)

#ifdef NDEBUG
#undef EMBER_DETAIL_ASSERT
#define EMBER_DETAIL_ASSERT(channel, condition, ...) \
	do {                                             \
		(void)(condition);                           \
	} while (0)
#endif

#pragma endregion

/// @brief Engine exception, logs itself with the location it was thrown from
class EmberException : public std::exception {
	std::string m_message;

public:
	EmberException(const std::string& message, std::source_location loc = std::source_location::current()) : m_message(message) {
		m_message += std::format("\n    at {0}:{1} ({2})", loc.file_name(), loc.line(), loc.function_name());
		EMBER_ERROR("Exception: {0}", m_message);
	}

	[[nodiscard]]
	const char* what() const noexcept override {
		return m_message.c_str();
	}
};
