#include <Ember/Input/KeyCodes.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace ember::input {

namespace {

using enum VirtualKeyCode;

// Indexed by the enum value, keep in declaration order
constexpr std::array KEY_NAMES = {
	"1",          "2",           "3",         "4",          "5",          "6",          "7",         "8",
	"9",          "0",           "a",         "b",          "c",          "d",          "e",         "f",
	"g",          "h",           "i",         "j",          "k",          "l",          "m",         "n",
	"o",          "p",           "q",         "r",          "s",          "t",          "u",         "v",
	"w",          "x",           "y",         "z",          "escape",     "f1",         "f2",        "f3",
	"f4",         "f5",          "f6",        "f7",         "f8",         "f9",         "f10",       "f11",
	"f12",        "print_screen", "scroll_lock", "pause",    "insert",     "home",       "delete",    "end",
	"page_down",  "page_up",     "left",      "up",         "right",      "down",       "back",      "return",
	"space",      "tab",         "num_lock",  "numpad_0",   "numpad_1",   "numpad_2",   "numpad_3",  "numpad_4",
	"numpad_5",   "numpad_6",    "numpad_7",  "numpad_8",   "numpad_9",   "numpad_add", "numpad_subtract",
	"numpad_multiply", "numpad_divide", "numpad_decimal", "numpad_enter", "apostrophe", "backslash", "comma",
	"equals",     "grave",       "left_bracket", "right_bracket", "minus", "period",   "semicolon", "slash",
	"caps_lock",  "left_alt",    "left_control", "left_shift", "left_super", "right_alt", "right_control",
	"right_shift", "right_super",
};

static_assert(KEY_NAMES.size() == static_cast<size_t>(RWin) + 1, "Every key needs a name");

constexpr std::array<std::pair<std::string_view, VirtualKeyCode>, 10> KEY_ALIASES = { {
    { "esc", Escape },
    { "enter", Return },
    { "backspace", Back },
    { "ctrl", LControl },
    { "control", LControl },
    { "shift", LShift },
    { "alt", LAlt },
    { "super", LWin },
    { "caps", Capital },
    { "print", Snapshot },
} };

std::string NormalizeName(std::string_view name) {
	auto first = std::find_if_not(name.begin(), name.end(), [](unsigned char c) {
		return std::isspace(c);
	});
	auto last = std::find_if_not(name.rbegin(), name.rend(), [](unsigned char c) {
		            return std::isspace(c);
	            }).base();

	std::string normalized;
	if (first >= last) {
		return normalized;
	}
	normalized.reserve(static_cast<size_t>(last - first));
	for (auto it = first; it != last; ++it) {
		char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*it)));
		if (c == ' ' || c == '-') {
			c = '_';
		}
		normalized.push_back(c);
	}
	return normalized;
}

}

std::string_view KeyName(VirtualKeyCode key) noexcept {
	const auto index = static_cast<size_t>(key);
	if (index >= KEY_NAMES.size()) {
		return "unknown";
	}
	return KEY_NAMES[index];
}

std::optional<VirtualKeyCode> KeyFromName(std::string_view name) {
	const std::string normalized = NormalizeName(name);
	if (normalized.empty()) {
		return std::nullopt;
	}

	for (size_t i = 0; i < KEY_NAMES.size(); ++i) {
		if (normalized == KEY_NAMES[i]) {
			return static_cast<VirtualKeyCode>(i);
		}
	}

	for (const auto& [alias, key] : KEY_ALIASES) {
		if (normalized == alias) {
			return key;
		}
	}

	return std::nullopt;
}

}
