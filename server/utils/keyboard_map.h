/*
 * Browser Key Name to DevTools Key Metadata
 *
 * Viewers send KeyboardEvent.key values ("Enter", "ArrowLeft", "a").
 * Named keys have to be dispatched to Chromium with a DOM code and a
 * Windows virtual key code, otherwise pages never see keydown for them.
 */

#ifndef KEYBOARD_MAP_H
#define KEYBOARD_MAP_H

#include <string>

namespace keyboard_map {

struct KeyInfo {
    std::string key;       // KeyboardEvent.key
    std::string code;      // KeyboardEvent.code
    int virtual_keycode;   // windowsVirtualKeyCode / nativeVirtualKeyCode
    std::string text;      // Text inserted by the key, empty for non-printing keys
};

/**
 * Look up a named key
 *
 * @param name KeyboardEvent.key value
 * @param info Filled with the key metadata when found
 * @return true if the name is a known key
 */
bool lookup_named_key(const std::string& name, KeyInfo& info);

} // namespace keyboard_map

#endif // KEYBOARD_MAP_H
