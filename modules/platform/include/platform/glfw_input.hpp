#pragma once

#include "input/events.hpp"
#include "input/input.hpp"

#include "common/include.hpp"

namespace tacto {

// GLFW key token to virtual key code, -1 for keys without one
KeyCode GlfwKeyToKeyCode(int key);

MouseButton GlfwToMouseButton(int button);

// GLFW reports scrolling up as a positive offset, wheel deltas grow downwards
glm::dvec2 ScrollToWheelDelta(double x_offset, double y_offset,
                              double wheel_step);

// Scales a window coordinate to the canvas resolution, rounding to the
// nearest pixel. A zero window size leaves the coordinate unscaled.
int WindowToCanvas(double position, int canvas_size, uint32_t window_size);

}  // namespace tacto
