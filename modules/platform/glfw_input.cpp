#include "platform/glfw_input.hpp"

#include <GLFW/glfw3.h>

#include <cmath>

namespace tacto {

KeyCode GlfwKeyToKeyCode(int key) {
    // Digits and letters share their ASCII values with virtual key codes
    if ((key >= GLFW_KEY_0 && key <= GLFW_KEY_9) ||
        (key >= GLFW_KEY_A && key <= GLFW_KEY_Z)) {
        return key;
    }
    if (key >= GLFW_KEY_KP_0 && key <= GLFW_KEY_KP_9) {
        return 96 + (key - GLFW_KEY_KP_0);
    }
    if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F24) {
        return 112 + (key - GLFW_KEY_F1);
    }

    switch (key) {
        case GLFW_KEY_BACKSPACE:
            return 8;
        case GLFW_KEY_TAB:
            return 9;
        case GLFW_KEY_ENTER:
        case GLFW_KEY_KP_ENTER:
            return 13;
        case GLFW_KEY_LEFT_SHIFT:
        case GLFW_KEY_RIGHT_SHIFT:
            return 16;
        case GLFW_KEY_LEFT_CONTROL:
        case GLFW_KEY_RIGHT_CONTROL:
            return 17;
        case GLFW_KEY_LEFT_ALT:
        case GLFW_KEY_RIGHT_ALT:
            return 18;
        case GLFW_KEY_PAUSE:
            return 19;
        case GLFW_KEY_CAPS_LOCK:
            return 20;
        case GLFW_KEY_ESCAPE:
            return 27;
        case GLFW_KEY_SPACE:
            return 32;
        case GLFW_KEY_PAGE_UP:
            return 33;
        case GLFW_KEY_PAGE_DOWN:
            return 34;
        case GLFW_KEY_END:
            return 35;
        case GLFW_KEY_HOME:
            return 36;
        case GLFW_KEY_LEFT:
            return 37;
        case GLFW_KEY_UP:
            return 38;
        case GLFW_KEY_RIGHT:
            return 39;
        case GLFW_KEY_DOWN:
            return 40;
        case GLFW_KEY_INSERT:
            return 45;
        case GLFW_KEY_DELETE:
            return 46;
        case GLFW_KEY_KP_MULTIPLY:
            return 106;
        case GLFW_KEY_KP_ADD:
            return 107;
        case GLFW_KEY_KP_SUBTRACT:
            return 109;
        case GLFW_KEY_KP_DECIMAL:
            return 110;
        case GLFW_KEY_KP_DIVIDE:
            return 111;
        case GLFW_KEY_NUM_LOCK:
            return kKeyNumLock;
        case GLFW_KEY_SCROLL_LOCK:
            return 145;
        default:
            return -1;
    }
}

MouseButton GlfwToMouseButton(int button) {
    switch (button) {
        case GLFW_MOUSE_BUTTON_LEFT:
            return MouseButton::Left;
        case GLFW_MOUSE_BUTTON_MIDDLE:
            return MouseButton::Middle;
        case GLFW_MOUSE_BUTTON_RIGHT:
            return MouseButton::Right;
        default:
            return MouseButton::Other;
    }
}

glm::dvec2 ScrollToWheelDelta(double x_offset, double y_offset,
                              double wheel_step) {
    return {x_offset * wheel_step, -y_offset * wheel_step};
}

int WindowToCanvas(double position, int canvas_size, uint32_t window_size) {
    if (window_size == 0) {
        return static_cast<int>(std::round(position));
    }
    return static_cast<int>(std::round(position * canvas_size / window_size));
}

}  // namespace tacto
