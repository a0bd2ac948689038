/// @file KeyCodes.hpp
/// @brief Keyboard identities carried by keyboard events

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ember::input {

/// OS specific code of the physical key, stable across keyboard layouts
using ScanCode = uint32_t;

/// Whether a key went down or up
enum class ElementState : uint8_t {
	Pressed,
	Released
};

/// Semantic identity of a key, after the host keyboard layout has been applied
enum class VirtualKeyCode : uint16_t {
	Key1,
	Key2,
	Key3,
	Key4,
	Key5,
	Key6,
	Key7,
	Key8,
	Key9,
	Key0,

	A,
	B,
	C,
	D,
	E,
	F,
	G,
	H,
	I,
	J,
	K,
	L,
	M,
	N,
	O,
	P,
	Q,
	R,
	S,
	T,
	U,
	V,
	W,
	X,
	Y,
	Z,

	Escape,

	F1,
	F2,
	F3,
	F4,
	F5,
	F6,
	F7,
	F8,
	F9,
	F10,
	F11,
	F12,

	Snapshot,
	Scroll,
	Pause,

	Insert,
	Home,
	Delete,
	End,
	PageDown,
	PageUp,

	Left,
	Up,
	Right,
	Down,

	Back,
	Return,
	Space,
	Tab,

	Numlock,
	Numpad0,
	Numpad1,
	Numpad2,
	Numpad3,
	Numpad4,
	Numpad5,
	Numpad6,
	Numpad7,
	Numpad8,
	Numpad9,
	NumpadAdd,
	NumpadSubtract,
	NumpadMultiply,
	NumpadDivide,
	NumpadDecimal,
	NumpadEnter,

	Apostrophe,
	Backslash,
	Comma,
	Equals,
	Grave,
	LBracket,
	RBracket,
	Minus,
	Period,
	Semicolon,
	Slash,
	Capital,

	LAlt,
	LControl,
	LShift,
	LWin,
	RAlt,
	RControl,
	RShift,
	RWin,
};

/// @brief Canonical lowercase name of a key, e.g. "a", "page_up", "numpad_3"
[[nodiscard]]
std::string_view KeyName(VirtualKeyCode key) noexcept;

/// @brief Parses a key name
///
/// Matching ignores case and surrounding whitespace, spaces and dashes count
/// as underscores. A few aliases are accepted ("esc", "enter", "backspace",
/// "ctrl", "shift", "alt").
[[nodiscard]]
std::optional<VirtualKeyCode> KeyFromName(std::string_view name);

}
