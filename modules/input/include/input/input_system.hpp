#pragma once

#include "input/canvas.hpp"
#include "input/events.hpp"
#include "input/gamepad.hpp"
#include "input/keyboard_gamepad_input.hpp"
#include "input/pointer_input.hpp"

#include "common/include.hpp"

namespace tacto {

// Routes host events to the keyboard/gamepad and pointer components and
// ticks both once per frame.
class InputSystem : public InputEventHandler {
  public:
    struct Config {
        KeyboardGamepadInput::Config keyboard{};
        PointerInput::Config pointer{};
    };

    InputSystem(const CanvasMapper& canvas, GamepadSource* gamepads = nullptr);

    result<void> Initialize();
    result<void> Initialize(const Config& config);
    void Clear();

    result<void> AcquireFrameInput();

    const KeyboardGamepadInput& keyboard() const { return keyboard_; }
    const PointerInput& pointer() const { return pointer_; }
    uint64_t frame_count() const { return frame_count_; }

    virtual void OnKeyDown(KeyCode code) override;
    virtual void OnKeyUp(KeyCode code) override;

    virtual void OnMouseDown(const MouseEvent& event) override;
    virtual void OnMouseMove(const MouseEvent& event) override;
    virtual void OnMouseUp(const MouseEvent& event) override;
    virtual void OnWheel(const WheelEvent& event) override;

    virtual void OnTouchStart(const TouchEvent& event) override;
    virtual void OnTouchMove(const TouchEvent& event) override;
    virtual void OnTouchEnd(const TouchEvent& event) override;
    virtual void OnTouchCancel(const TouchEvent& event) override;
    virtual void OnPointerDown(const PointerEvent& event) override;

    virtual void OnFocusLost() override;

  private:
    GamepadSource* gamepads_{nullptr};

    KeyboardGamepadInput keyboard_;
    PointerInput pointer_;

    uint64_t frame_count_{0};
};

}  // namespace tacto
