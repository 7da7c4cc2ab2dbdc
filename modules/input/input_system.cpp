#include "input/input_system.hpp"

namespace tacto {

InputSystem::InputSystem(const CanvasMapper& canvas, GamepadSource* gamepads)
    : gamepads_(gamepads), keyboard_(), pointer_(canvas) {}

result<void> InputSystem::Initialize() { return Initialize(Config{}); }

result<void> InputSystem::Initialize(const Config& config) {
    // Both components keep their previous config unless both are valid
    OUTCOME_TRY(KeyboardGamepadInput::ValidateConfig(config.keyboard));
    OUTCOME_TRY(PointerInput::ValidateConfig(config.pointer));

    OUTCOME_TRY(keyboard_.Initialize(config.keyboard));
    OUTCOME_TRY(pointer_.Initialize(config.pointer));

    if (!gamepads_ || !gamepads_->SupportsGamepads()) {
        spdlog::info("No gamepad support, only keyboard input is polled.");
    }

    frame_count_ = 0;
    return outcome::success();
}

void InputSystem::Clear() {
    keyboard_.Clear();
    pointer_.Clear();
}

result<void> InputSystem::AcquireFrameInput() {
    keyboard_.Update(gamepads_);
    pointer_.Update();

    frame_count_++;
    return outcome::success();
}

void InputSystem::OnKeyDown(KeyCode code) { keyboard_.OnKeyDown(code); }

void InputSystem::OnKeyUp(KeyCode code) { keyboard_.OnKeyUp(code); }

void InputSystem::OnMouseDown(const MouseEvent& event) {
    pointer_.OnMouseDown(event);
}

void InputSystem::OnMouseMove(const MouseEvent& event) {
    pointer_.OnMouseMove(event);
}

void InputSystem::OnMouseUp(const MouseEvent& event) {
    pointer_.OnMouseUp(event);
}

void InputSystem::OnWheel(const WheelEvent& event) { pointer_.OnWheel(event); }

void InputSystem::OnTouchStart(const TouchEvent& event) {
    pointer_.OnTouchStart(event);
}

void InputSystem::OnTouchMove(const TouchEvent& event) {
    pointer_.OnTouchMove(event);
}

void InputSystem::OnTouchEnd(const TouchEvent& event) {
    pointer_.OnTouchEnd(event);
}

void InputSystem::OnTouchCancel(const TouchEvent& event) {
    pointer_.OnTouchCancel(event);
}

void InputSystem::OnPointerDown(const PointerEvent& event) {
    pointer_.OnPointerDown(event);
}

void InputSystem::OnFocusLost() {
    spdlog::debug("Window lost focus, clearing input state.");
    Clear();
}

}  // namespace tacto
