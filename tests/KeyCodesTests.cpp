#include <Ember/Input/KeyCodes.hpp>
#include <gtest/gtest.h>

using namespace ember::input;

TEST(KeyCodes, Names) {
	EXPECT_EQ(KeyName(VirtualKeyCode::A), "a");
	EXPECT_EQ(KeyName(VirtualKeyCode::Key1), "1");
	EXPECT_EQ(KeyName(VirtualKeyCode::PageUp), "page_up");
	EXPECT_EQ(KeyName(VirtualKeyCode::Numpad3), "numpad_3");
	EXPECT_EQ(KeyName(VirtualKeyCode::LControl), "left_control");
	EXPECT_EQ(KeyName(VirtualKeyCode::RWin), "right_super");
	EXPECT_EQ(KeyName(static_cast<VirtualKeyCode>(5000)), "unknown");
}

TEST(KeyCodes, EveryNameParsesBack) {
	for (auto i = static_cast<uint16_t>(VirtualKeyCode::Key1); i <= static_cast<uint16_t>(VirtualKeyCode::RWin); i++) {
		const auto key = static_cast<VirtualKeyCode>(i);
		EXPECT_EQ(KeyFromName(KeyName(key)), key) << KeyName(key);
	}
}

TEST(KeyCodes, LooseSpelling) {
	EXPECT_EQ(KeyFromName("  Page Up "), VirtualKeyCode::PageUp);
	EXPECT_EQ(KeyFromName("LEFT-SHIFT"), VirtualKeyCode::LShift);
	EXPECT_EQ(KeyFromName("Esc"), VirtualKeyCode::Escape);
	EXPECT_EQ(KeyFromName("enter"), VirtualKeyCode::Return);
	EXPECT_EQ(KeyFromName("ctrl"), VirtualKeyCode::LControl);
	EXPECT_EQ(KeyFromName("caps"), VirtualKeyCode::Capital);

	EXPECT_FALSE(KeyFromName("").has_value());
	EXPECT_FALSE(KeyFromName("   ").has_value());
	EXPECT_FALSE(KeyFromName("hyper").has_value());
}
