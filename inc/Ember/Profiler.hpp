/// @file   Profiler.hpp
/// @brief  Tracy instrumentation, compiled out unless TRACY_ENABLE is defined
///
/// Configure with -DEMBER_TRACY=ON and connect the Tracy server to see the
/// dispatch rounds of every handler next to the frame markers.

#pragma once

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

#define EMBER_PROFILE_FRAME FrameMark
#define EMBER_PROFILE_ZONE_N(name) ZoneScopedN(name)
#define EMBER_PROFILE_PLOT(name, value) TracyPlot(name, static_cast<int64_t>(value))
#define EMBER_PROFILE_MESSAGE(text, size) TracyMessage(text, size)
#define EMBER_PROFILE_MESSAGE_C(text, size, color) TracyMessageC(text, size, color)

#else

/// End of a frame
#define EMBER_PROFILE_FRAME

/// Named zone lasting until the end of the scope
#define EMBER_PROFILE_ZONE_N(name)

/// Sample of a named value over time
#define EMBER_PROFILE_PLOT(name, value)

/// Message on the profiler timeline, the log macros send one per line
#define EMBER_PROFILE_MESSAGE(text, size)
#define EMBER_PROFILE_MESSAGE_C(text, size, color)

#endif
