#include "input/key_map.hpp"

#include "input/gamepad.hpp"

namespace tacto {

const std::vector<KeyMap::Binding>& DefaultKeyBindings() {
    static const std::vector<KeyMap::Binding> bindings{
        {9, Button::Tab},         // tab
        {13, Button::Ok},         // enter
        {16, Button::Shift},      // shift
        {17, Button::Control},    // control
        {18, Button::Control},    // alt
        {27, Button::Escape},     // escape
        {32, Button::Ok},         // space
        {33, Button::PageUp},     // page up
        {34, Button::PageDown},   // page down
        {37, Button::Left},       // left arrow
        {38, Button::Up},         // up arrow
        {39, Button::Right},      // right arrow
        {40, Button::Down},       // down arrow
        {45, Button::Escape},     // insert
        {81, Button::PageUp},     // Q
        {87, Button::PageDown},   // W
        {88, Button::Escape},     // X
        {90, Button::Ok},         // Z
        {96, Button::Escape},     // numpad 0
        {98, Button::Down},       // numpad 2
        {100, Button::Left},      // numpad 4
        {102, Button::Right},     // numpad 6
        {104, Button::Up},        // numpad 8
        {120, Button::Debug},     // F9
    };
    return bindings;
}

const std::vector<GamepadMap::Binding>& DefaultGamepadBindings() {
    static const std::vector<GamepadMap::Binding> bindings{
        {kPadA, Button::Ok},
        {kPadB, Button::Cancel},
        {kPadX, Button::Shift},
        {kPadY, Button::Menu},
        {kPadLeftBumper, Button::PageUp},
        {kPadRightBumper, Button::PageDown},
        {kPadDpadUp, Button::Up},
        {kPadDpadDown, Button::Down},
        {kPadDpadLeft, Button::Left},
        {kPadDpadRight, Button::Right},
    };
    return bindings;
}

KeyMap DefaultKeyMap() { return KeyMap::Create(DefaultKeyBindings()).value(); }

GamepadMap DefaultGamepadMap() {
    return GamepadMap::Create(DefaultGamepadBindings()).value();
}

}  // namespace tacto
