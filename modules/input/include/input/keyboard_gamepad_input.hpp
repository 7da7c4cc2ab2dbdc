#pragma once

#include "input/input.hpp"
#include "input/gamepad.hpp"
#include "input/key_map.hpp"

#include "common/include.hpp"
#include "common/clock.hpp"

namespace tacto {

// Keyboard and gamepad state merged into one table of logical buttons,
// sampled once per frame.
class KeyboardGamepadInput {
  public:
    struct Config {
        KeyMap key_map{DefaultKeyMap()};
        GamepadMap gamepad_map{DefaultGamepadMap()};
        RepeatTiming repeat{};
        float axis_threshold{0.5f};
        ClockFn clock{SteadyClockMillis};
    };

    KeyboardGamepadInput();
    explicit KeyboardGamepadInput(const Config& config);

    static result<void> ValidateConfig(const Config& config);

    result<void> Initialize(const Config& config);
    void Clear();

    // Must run exactly once per frame. A null source, or one without
    // gamepad support, skips gamepad polling.
    void Update(GamepadSource* gamepads = nullptr);

    void OnKeyDown(KeyCode code);
    void OnKeyUp(KeyCode code);

    bool IsPressed(Button button) const;
    bool IsTriggered(Button button) const;
    bool IsRepeated(Button button) const;
    bool IsLongPressed(Button button) const;

    bool IsPressed(const std::string& name) const {
        return IsPressed(ButtonFromName(name));
    }
    bool IsTriggered(const std::string& name) const {
        return IsTriggered(ButtonFromName(name));
    }
    bool IsRepeated(const std::string& name) const {
        return IsRepeated(ButtonFromName(name));
    }
    bool IsLongPressed(const std::string& name) const {
        return IsLongPressed(ButtonFromName(name));
    }

    // Direction as a numpad value (8 = up, 6 = right, ...), 0 when neutral
    int dir4() const { return dir4_; }
    int dir8() const { return dir8_; }

    Timestamp last_input_timestamp() const { return date_; }
    Button latest_button() const { return latest_button_; }
    uint32_t pressed_frames() const { return pressed_frames_; }
    Axis preferred_axis() const { return preferred_axis_; }

    const Config& config() const { return config_; }

  private:
    using ButtonState = std::array<bool, kButtonCount>;

    Config config_;

    ButtonState current_state_{};
    ButtonState previous_state_{};
    GamepadAxisCache gamepad_states_{};

    Button latest_button_{Button::None};
    uint32_t pressed_frames_{0};
    Timestamp date_{0};

    int dir4_{0};
    int dir8_{0};
    Axis preferred_axis_{Axis::None};

    bool IsHeld(Button button) const {
        return button != Button::None && current_state_[ButtonIndex(button)];
    }
    void SetHeld(Button button, bool held);

    void PollGamepads(GamepadSource& gamepads);
    void ApplyGamepadChanges(
        const std::vector<GamepadAxisCache::Change>& changes);
    void UpdateDirection();
};

int MakeNumpadDirection(int x, int y);

}  // namespace tacto
