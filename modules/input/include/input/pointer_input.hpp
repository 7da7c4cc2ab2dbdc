#pragma once

#include "input/input.hpp"
#include "input/canvas.hpp"
#include "input/events.hpp"

#include "common/include.hpp"
#include "common/clock.hpp"

namespace tacto {

// Mouse and touchscreen state. Raw events are buffered between frames and
// published as a stable snapshot by Update().
class PointerInput {
  public:
    struct Config {
        RepeatTiming repeat{};

        // A touch start with two or more contact points cancels instead of
        // triggering
        bool multi_touch_cancel{true};
        // A non-primary touch pointer cancels, for hosts that report
        // multi-touch through pointer events only
        bool secondary_pointer_cancel{true};

        ClockFn clock{SteadyClockMillis};
    };

    explicit PointerInput(const CanvasMapper& canvas);
    PointerInput(const CanvasMapper& canvas, const Config& config);

    static result<void> ValidateConfig(const Config& config);

    result<void> Initialize(const Config& config);
    void Clear();

    // Must run exactly once per frame
    void Update();

    void OnMouseDown(const MouseEvent& event);
    void OnMouseMove(const MouseEvent& event);
    void OnMouseUp(const MouseEvent& event);
    void OnWheel(const WheelEvent& event);
    void OnTouchStart(const TouchEvent& event);
    void OnTouchMove(const TouchEvent& event);
    void OnTouchEnd(const TouchEvent& event);
    void OnTouchCancel(const TouchEvent& event);
    void OnPointerDown(const PointerEvent& event);

    // Live state, not sampled at Update()
    bool IsPressed() const { return mouse_pressed_ || screen_pressed_; }

    bool IsTriggered() const { return published_.triggered; }
    bool IsRepeated() const;
    bool IsLongPressed() const;
    bool IsCancelled() const { return published_.cancelled; }
    bool IsMoved() const { return published_.moved; }
    bool IsReleased() const { return published_.released; }

    int x() const { return published_.position.x; }
    int y() const { return published_.position.y; }
    double wheel_x() const { return published_.wheel.x; }
    double wheel_y() const { return published_.wheel.y; }
    Timestamp last_input_timestamp() const { return published_.date; }

    uint32_t pressed_frames() const { return pressed_frames_; }
    const Config& config() const { return config_; }

  private:
    struct Events {
        bool triggered{false};
        bool cancelled{false};
        bool moved{false};
        bool released{false};
        glm::dvec2 wheel{0.0, 0.0};
        glm::ivec2 position{0, 0};
        Timestamp date{0};
    };

    const CanvasMapper& canvas_;
    Config config_;

    bool mouse_pressed_{false};
    bool screen_pressed_{false};
    uint32_t pressed_frames_{0};

    Events pending_{};
    Events published_{};

    glm::ivec2 ToCanvas(const glm::dvec2& page_position) const;
    bool IsInside(const glm::ivec2& position) const;

    void OnLeftButtonDown(const MouseEvent& event);
    void OnRightButtonDown(const MouseEvent& event);

    void OnTrigger(const glm::ivec2& position);
    void OnCancel(const glm::ivec2& position);
    void OnMove(const glm::ivec2& position);
    void OnRelease(const glm::ivec2& position);
};

}  // namespace tacto
