#pragma once

#include "common/include.hpp"

namespace tacto {

// Logical buttons, decoupled from the physical keys that drive them.
// None is the explicit "no mapping" variant.
enum class Button {
    Tab,
    Ok,
    Shift,
    Control,
    Escape,
    PageUp,
    PageDown,
    Left,
    Up,
    Right,
    Down,
    Debug,
    Cancel,
    Menu,
    None,
};

constexpr size_t kButtonCount = static_cast<size_t>(Button::None);

inline size_t ButtonIndex(Button button) {
    return static_cast<size_t>(button);
}

const char* ButtonName(Button button);
Button ButtonFromName(const std::string& name);

// Cancel and menu are also satisfied by a held escape key
inline bool IsEscapeCompatible(Button button) {
    return button == Button::Cancel || button == Button::Menu;
}

// Virtual key codes (tab = 9, enter = 13, ...)
using KeyCode = int;

constexpr KeyCode kKeyNumLock = 144;
constexpr size_t kKeyCodeCount = 256;

// Button slots tracked per gamepad, standard layout
constexpr size_t kGamepadButtonCount = 32;

enum class Axis { None, X, Y };

// Wait and interval of the pseudo key repeat, in frames
struct RepeatTiming {
    uint32_t wait_frames{24};
    uint32_t interval_frames{6};

    // A zero interval is rejected by Initialize(). An unvalidated one
    // repeats once, on the wait frame.
    bool IsRepeatFrame(uint32_t pressed_frames) const {
        if (interval_frames == 0) {
            return pressed_frames == wait_frames;
        }
        return pressed_frames >= wait_frames &&
               (pressed_frames - wait_frames) % interval_frames == 0;
    }

    bool IsLongPress(uint32_t pressed_frames) const {
        return pressed_frames >= wait_frames;
    }
};

}  // namespace tacto
