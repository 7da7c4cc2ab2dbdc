#pragma once

#include "input/input.hpp"

#include "common/include.hpp"

namespace tacto {

enum class MouseButton { Left, Middle, Right, Other };

struct MouseEvent {
    MouseButton button{MouseButton::Left};
    glm::dvec2 page_position{};
};

struct WheelEvent {
    glm::dvec2 delta{};
};

struct TouchPoint {
    int id{0};
    glm::dvec2 page_position{};
};

struct TouchEvent {
    // Contact points that changed with this event
    std::vector<TouchPoint> changed_touches{};
    // Contact points still on the surface, including the changed ones
    size_t active_touches{0};
};

enum class PointerType { Mouse, Pen, Touch };

struct PointerEvent {
    PointerType type{PointerType::Mouse};
    bool is_primary{true};
    glm::dvec2 page_position{};
};

// Receives raw events from the host. All calls happen on the host event
// thread, zero or more times between two frames.
class InputEventHandler {
  public:
    virtual ~InputEventHandler() = default;

    virtual void OnKeyDown(KeyCode code) = 0;
    virtual void OnKeyUp(KeyCode code) = 0;

    virtual void OnMouseDown(const MouseEvent& event) = 0;
    virtual void OnMouseMove(const MouseEvent& event) = 0;
    virtual void OnMouseUp(const MouseEvent& event) = 0;
    virtual void OnWheel(const WheelEvent& event) = 0;

    virtual void OnTouchStart(const TouchEvent& event) = 0;
    virtual void OnTouchMove(const TouchEvent& event) = 0;
    virtual void OnTouchEnd(const TouchEvent& event) = 0;
    virtual void OnTouchCancel(const TouchEvent& event) = 0;
    virtual void OnPointerDown(const PointerEvent& event) = 0;

    virtual void OnFocusLost() = 0;
};

}  // namespace tacto
