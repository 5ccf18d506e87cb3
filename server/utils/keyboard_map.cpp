/*
 * Browser Key Name to DevTools Key Metadata
 */

#include "keyboard_map.h"
#include <cstdlib>

namespace keyboard_map {

namespace {

struct NamedKey {
    const char* key;
    const char* code;
    int vk;
    const char* text;
};

const NamedKey kNamedKeys[] = {
    { "Enter",      "Enter",        13, "\r" },
    { "Tab",        "Tab",           9, "\t" },
    { "Backspace",  "Backspace",     8, ""   },
    { "Escape",     "Escape",       27, ""   },
    { " ",          "Space",        32, " "  },
    { "Spacebar",   "Space",        32, " "  },
    { "PageUp",     "PageUp",       33, ""   },
    { "PageDown",   "PageDown",     34, ""   },
    { "End",        "End",          35, ""   },
    { "Home",       "Home",         36, ""   },
    { "ArrowLeft",  "ArrowLeft",    37, ""   },
    { "ArrowUp",    "ArrowUp",      38, ""   },
    { "ArrowRight", "ArrowRight",   39, ""   },
    { "ArrowDown",  "ArrowDown",    40, ""   },
    { "Insert",     "Insert",       45, ""   },
    { "Delete",     "Delete",       46, ""   },
    { "Shift",      "ShiftLeft",    16, ""   },
    { "Control",    "ControlLeft",  17, ""   },
    { "Alt",        "AltLeft",      18, ""   },
    { "Meta",       "MetaLeft",     91, ""   },
    { "CapsLock",   "CapsLock",     20, ""   },
    { "ContextMenu", "ContextMenu", 93, ""   },
};

} // namespace

bool lookup_named_key(const std::string& name, KeyInfo& info) {
    for (const auto& k : kNamedKeys) {
        if (name == k.key) {
            info.key = name;
            info.code = k.code;
            info.virtual_keycode = k.vk;
            info.text = k.text;
            return true;
        }
    }

    // F1-F12 (VK_F1 = 112)
    if (name.size() >= 2 && name.size() <= 3 && name[0] == 'F') {
        char* end = nullptr;
        long n = strtol(name.c_str() + 1, &end, 10);
        if (end && *end == '\0' && n >= 1 && n <= 12) {
            info.key = name;
            info.code = name;
            info.virtual_keycode = 111 + static_cast<int>(n);
            info.text.clear();
            return true;
        }
    }

    return false;
}

} // namespace keyboard_map
