#include "input/keyboard_gamepad_input.hpp"

#include "common/error_codes.hpp"

namespace tacto {

KeyboardGamepadInput::KeyboardGamepadInput()
    : KeyboardGamepadInput(Config{}) {}

KeyboardGamepadInput::KeyboardGamepadInput(const Config& config)
    : config_(config) {
    if (!config_.clock) {
        config_.clock = SteadyClockMillis;
    }
}

result<void> KeyboardGamepadInput::ValidateConfig(const Config& config) {
    if (config.repeat.interval_frames == 0) {
        return Error::InvalidRepeatTiming;
    }
    if (!(config.axis_threshold > 0.0f && config.axis_threshold < 1.0f)) {
        return Error::InvalidAxisThreshold;
    }

    return outcome::success();
}

result<void> KeyboardGamepadInput::Initialize(const Config& config) {
    OUTCOME_TRY(ValidateConfig(config));

    config_ = config;
    if (!config_.clock) {
        config_.clock = SteadyClockMillis;
    }
    Clear();

    spdlog::info(
        "Keyboard/gamepad input initialized, {} keys and {} gamepad buttons "
        "mapped.",
        config_.key_map.mapped_count(), config_.gamepad_map.mapped_count());

    return outcome::success();
}

void KeyboardGamepadInput::Clear() {
    current_state_.fill(false);
    previous_state_.fill(false);
    gamepad_states_.Clear();

    latest_button_ = Button::None;
    pressed_frames_ = 0;
    date_ = 0;

    dir4_ = 0;
    dir8_ = 0;
    preferred_axis_ = Axis::None;
}

void KeyboardGamepadInput::Update(GamepadSource* gamepads) {
    if (gamepads) {
        PollGamepads(*gamepads);
    }

    if (IsHeld(latest_button_)) {
        pressed_frames_++;
    } else {
        latest_button_ = Button::None;
    }

    for (size_t i = 0; i < kButtonCount; i++) {
        if (current_state_[i] && !previous_state_[i]) {
            latest_button_ = static_cast<Button>(i);
            pressed_frames_ = 0;
            date_ = config_.clock();
        }
        previous_state_[i] = current_state_[i];
    }

    UpdateDirection();
}

void KeyboardGamepadInput::OnKeyDown(KeyCode code) {
    if (code == kKeyNumLock) {
        // Num lock can swallow key up events of the numpad
        spdlog::debug("Num lock toggled, clearing keyboard/gamepad state.");
        Clear();
    }

    SetHeld(config_.key_map.Lookup(code), true);
}

void KeyboardGamepadInput::OnKeyUp(KeyCode code) {
    SetHeld(config_.key_map.Lookup(code), false);
}

bool KeyboardGamepadInput::IsPressed(Button button) const {
    if (IsEscapeCompatible(button) && IsPressed(Button::Escape)) {
        return true;
    }
    return IsHeld(button);
}

bool KeyboardGamepadInput::IsTriggered(Button button) const {
    if (IsEscapeCompatible(button) && IsTriggered(Button::Escape)) {
        return true;
    }
    return button != Button::None && latest_button_ == button &&
           pressed_frames_ == 0;
}

bool KeyboardGamepadInput::IsRepeated(Button button) const {
    if (IsEscapeCompatible(button) && IsRepeated(Button::Escape)) {
        return true;
    }
    return button != Button::None && latest_button_ == button &&
           (pressed_frames_ == 0 ||
            config_.repeat.IsRepeatFrame(pressed_frames_));
}

bool KeyboardGamepadInput::IsLongPressed(Button button) const {
    if (IsEscapeCompatible(button) && IsLongPressed(Button::Escape)) {
        return true;
    }
    return button != Button::None && latest_button_ == button &&
           config_.repeat.IsLongPress(pressed_frames_);
}

void KeyboardGamepadInput::SetHeld(Button button, bool held) {
    if (button == Button::None) {
        return;
    }
    current_state_[ButtonIndex(button)] = held;
}

void KeyboardGamepadInput::PollGamepads(GamepadSource& gamepads) {
    if (!gamepads.SupportsGamepads()) {
        return;
    }

    std::array<bool, kMaxGamepads> polled{};
    for (const auto& snapshot : gamepads.PollGamepads()) {
        if (!snapshot.connected) {
            continue;
        }
        if (snapshot.index < 0 ||
            static_cast<size_t>(snapshot.index) >= kMaxGamepads) {
            spdlog::trace("Ignoring gamepad in slot {}.", snapshot.index);
            continue;
        }

        polled[snapshot.index] = true;
        ApplyGamepadChanges(
            gamepad_states_.Update(snapshot, config_.axis_threshold));
    }

    // Release whatever an unplugged gamepad was still holding
    for (size_t slot = 0; slot < kMaxGamepads; slot++) {
        if (!polled[slot] && gamepad_states_.is_connected(slot)) {
            ApplyGamepadChanges(gamepad_states_.Disconnect(slot));
        }
    }
}

void KeyboardGamepadInput::ApplyGamepadChanges(
    const std::vector<GamepadAxisCache::Change>& changes) {
    for (const auto& change : changes) {
        SetHeld(config_.gamepad_map.Lookup(change.button_index),
                change.pressed);
    }
}

void KeyboardGamepadInput::UpdateDirection() {
    int x = 0;
    if (IsPressed(Button::Left)) {
        x--;
    }
    if (IsPressed(Button::Right)) {
        x++;
    }

    int y = 0;
    if (IsPressed(Button::Up)) {
        y--;
    }
    if (IsPressed(Button::Down)) {
        y++;
    }

    dir8_ = MakeNumpadDirection(x, y);

    if (x != 0 && y != 0) {
        if (preferred_axis_ == Axis::X) {
            y = 0;
        } else {
            x = 0;
        }
    } else if (x != 0) {
        preferred_axis_ = Axis::Y;
    } else if (y != 0) {
        preferred_axis_ = Axis::X;
    }

    dir4_ = MakeNumpadDirection(x, y);
}

int MakeNumpadDirection(int x, int y) {
    if (x != 0 || y != 0) {
        return 5 - y * 3 + x;
    }
    return 0;
}

}  // namespace tacto
