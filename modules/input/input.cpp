#include "input/input.hpp"

namespace tacto {

namespace {

constexpr std::array<const char*, kButtonCount> kButtonNames{
    "tab",  "ok",    "shift", "control", "escape", "pageup", "pagedown",
    "left", "up",    "right", "down",    "debug",  "cancel", "menu",
};

}  // namespace

const char* ButtonName(Button button) {
    if (button == Button::None) {
        return "none";
    }
    return kButtonNames[ButtonIndex(button)];
}

Button ButtonFromName(const std::string& name) {
    auto it = std::find(kButtonNames.begin(), kButtonNames.end(), name);
    if (it == kButtonNames.end()) {
        return Button::None;
    }
    return static_cast<Button>(std::distance(kButtonNames.begin(), it));
}

}  // namespace tacto
