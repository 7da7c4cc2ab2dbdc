#include "input/pointer_input.hpp"

#include "common/error_codes.hpp"

namespace tacto {

PointerInput::PointerInput(const CanvasMapper& canvas)
    : PointerInput(canvas, Config{}) {}

PointerInput::PointerInput(const CanvasMapper& canvas, const Config& config)
    : canvas_(canvas), config_(config) {
    if (!config_.clock) {
        config_.clock = SteadyClockMillis;
    }
}

result<void> PointerInput::ValidateConfig(const Config& config) {
    if (config.repeat.interval_frames == 0) {
        return Error::InvalidRepeatTiming;
    }

    return outcome::success();
}

result<void> PointerInput::Initialize(const Config& config) {
    OUTCOME_TRY(ValidateConfig(config));

    config_ = config;
    if (!config_.clock) {
        config_.clock = SteadyClockMillis;
    }
    Clear();

    spdlog::info("Pointer input initialized (multi-touch cancel: {}, "
                 "secondary pointer cancel: {}).",
                 config_.multi_touch_cancel, config_.secondary_pointer_cancel);

    return outcome::success();
}

void PointerInput::Clear() {
    mouse_pressed_ = false;
    screen_pressed_ = false;
    pressed_frames_ = 0;

    pending_ = {};
    published_ = {};
}

void PointerInput::Update() {
    published_ = pending_;

    // Coordinates and timestamp are last-known values and carry over
    pending_.triggered = false;
    pending_.cancelled = false;
    pending_.moved = false;
    pending_.released = false;
    pending_.wheel = {0.0, 0.0};

    if (IsPressed()) {
        pressed_frames_++;
    }
}

bool PointerInput::IsRepeated() const {
    return IsPressed() && (published_.triggered ||
                           config_.repeat.IsRepeatFrame(pressed_frames_));
}

bool PointerInput::IsLongPressed() const {
    return IsPressed() && config_.repeat.IsLongPress(pressed_frames_);
}

void PointerInput::OnMouseDown(const MouseEvent& event) {
    switch (event.button) {
        case MouseButton::Left:
            OnLeftButtonDown(event);
            break;
        case MouseButton::Right:
            OnRightButtonDown(event);
            break;
        case MouseButton::Middle:
            // Reserved
            break;
        default:
            break;
    }
}

void PointerInput::OnMouseMove(const MouseEvent& event) {
    if (mouse_pressed_) {
        OnMove(ToCanvas(event.page_position));
    }
}

void PointerInput::OnMouseUp(const MouseEvent& event) {
    if (event.button == MouseButton::Left) {
        mouse_pressed_ = false;
        OnRelease(ToCanvas(event.page_position));
    }
}

void PointerInput::OnWheel(const WheelEvent& event) {
    pending_.wheel += event.delta;
}

void PointerInput::OnTouchStart(const TouchEvent& event) {
    for (const auto& touch : event.changed_touches) {
        auto position = ToCanvas(touch.page_position);
        if (!IsInside(position)) {
            continue;
        }

        screen_pressed_ = true;
        pressed_frames_ = 0;
        if (config_.multi_touch_cancel && event.active_touches >= 2) {
            OnCancel(position);
        } else {
            OnTrigger(position);
        }
    }
}

void PointerInput::OnTouchMove(const TouchEvent& event) {
    for (const auto& touch : event.changed_touches) {
        OnMove(ToCanvas(touch.page_position));
    }
}

void PointerInput::OnTouchEnd(const TouchEvent& event) {
    for (const auto& touch : event.changed_touches) {
        screen_pressed_ = false;
        OnRelease(ToCanvas(touch.page_position));
    }
}

void PointerInput::OnTouchCancel(const TouchEvent&) {
    // Interrupted by the system: no release event
    screen_pressed_ = false;
}

void PointerInput::OnPointerDown(const PointerEvent& event) {
    if (!config_.secondary_pointer_cancel ||
        event.type != PointerType::Touch || event.is_primary) {
        return;
    }

    auto position = ToCanvas(event.page_position);
    if (IsInside(position)) {
        OnCancel(position);
    }
}

glm::ivec2 PointerInput::ToCanvas(const glm::dvec2& page_position) const {
    return {canvas_.PageToCanvasX(page_position.x),
            canvas_.PageToCanvasY(page_position.y)};
}

bool PointerInput::IsInside(const glm::ivec2& position) const {
    return canvas_.IsInsideCanvas(position.x, position.y);
}

void PointerInput::OnLeftButtonDown(const MouseEvent& event) {
    auto position = ToCanvas(event.page_position);
    if (IsInside(position)) {
        mouse_pressed_ = true;
        pressed_frames_ = 0;
        OnTrigger(position);
    }
}

void PointerInput::OnRightButtonDown(const MouseEvent& event) {
    auto position = ToCanvas(event.page_position);
    if (IsInside(position)) {
        OnCancel(position);
    }
}

void PointerInput::OnTrigger(const glm::ivec2& position) {
    pending_.triggered = true;
    pending_.position = position;
    pending_.date = config_.clock();
}

void PointerInput::OnCancel(const glm::ivec2& position) {
    pending_.cancelled = true;
    pending_.position = position;
}

void PointerInput::OnMove(const glm::ivec2& position) {
    pending_.moved = true;
    pending_.position = position;
}

void PointerInput::OnRelease(const glm::ivec2& position) {
    pending_.released = true;
    pending_.position = position;
}

}  // namespace tacto
