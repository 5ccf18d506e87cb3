/*
 * Key map tests
 */

#include "test_framework.h"
#include "utils/keyboard_map.h"
#include <string>

using keyboard_map::KeyInfo;
using keyboard_map::lookup_named_key;

TEST(enter_inserts_carriage_return) {
    KeyInfo info;
    ASSERT_TRUE(lookup_named_key("Enter", info));
    ASSERT_EQ(info.code, std::string("Enter"));
    ASSERT_EQ(info.virtual_keycode, 13);
    ASSERT_EQ(info.text, std::string("\r"));
}

TEST(arrows_and_navigation_keys) {
    KeyInfo info;
    ASSERT_TRUE(lookup_named_key("ArrowLeft", info));
    ASSERT_EQ(info.virtual_keycode, 37);
    ASSERT_TRUE(info.text.empty());

    ASSERT_TRUE(lookup_named_key("ArrowDown", info));
    ASSERT_EQ(info.virtual_keycode, 40);

    ASSERT_TRUE(lookup_named_key("PageDown", info));
    ASSERT_EQ(info.virtual_keycode, 34);

    ASSERT_TRUE(lookup_named_key("Backspace", info));
    ASSERT_EQ(info.virtual_keycode, 8);
}

TEST(space_has_text) {
    KeyInfo info;
    ASSERT_TRUE(lookup_named_key(" ", info));
    ASSERT_EQ(info.code, std::string("Space"));
    ASSERT_EQ(info.text, std::string(" "));
}

TEST(modifiers_use_left_codes) {
    KeyInfo info;
    ASSERT_TRUE(lookup_named_key("Shift", info));
    ASSERT_EQ(info.code, std::string("ShiftLeft"));
    ASSERT_TRUE(lookup_named_key("Meta", info));
    ASSERT_EQ(info.virtual_keycode, 91);
}

TEST(function_keys) {
    KeyInfo info;
    ASSERT_TRUE(lookup_named_key("F1", info));
    ASSERT_EQ(info.virtual_keycode, 112);
    ASSERT_TRUE(lookup_named_key("F12", info));
    ASSERT_EQ(info.virtual_keycode, 123);
    ASSERT_EQ(info.code, std::string("F12"));

    ASSERT_FALSE(lookup_named_key("F13", info));
    ASSERT_FALSE(lookup_named_key("F0", info));
    ASSERT_FALSE(lookup_named_key("Fx", info));
}

TEST(unknown_names) {
    KeyInfo info;
    ASSERT_FALSE(lookup_named_key("a", info));
    ASSERT_FALSE(lookup_named_key("", info));
    ASSERT_FALSE(lookup_named_key("enter", info));
    ASSERT_FALSE(lookup_named_key("MediaPlayPause", info));
}

int main() {
    return test_framework::run_all_tests("keyboard map");
}
