#include "platform/glfw_platform.hpp"
#include "platform/glfw_input.hpp"

#include "common/error_codes.hpp"

#include <GLFW/glfw3.h>

#include <thread>

namespace tacto {

namespace {

// GLFW gamepad buttons in standard layout order
constexpr std::array<std::pair<int, int>, 15> kGlfwToStandardButton{{
    {GLFW_GAMEPAD_BUTTON_A, kPadA},
    {GLFW_GAMEPAD_BUTTON_B, kPadB},
    {GLFW_GAMEPAD_BUTTON_X, kPadX},
    {GLFW_GAMEPAD_BUTTON_Y, kPadY},
    {GLFW_GAMEPAD_BUTTON_LEFT_BUMPER, kPadLeftBumper},
    {GLFW_GAMEPAD_BUTTON_RIGHT_BUMPER, kPadRightBumper},
    {GLFW_GAMEPAD_BUTTON_BACK, kPadBack},
    {GLFW_GAMEPAD_BUTTON_START, kPadStart},
    {GLFW_GAMEPAD_BUTTON_GUIDE, kPadGuide},
    {GLFW_GAMEPAD_BUTTON_LEFT_THUMB, kPadLeftThumb},
    {GLFW_GAMEPAD_BUTTON_RIGHT_THUMB, kPadRightThumb},
    {GLFW_GAMEPAD_BUTTON_DPAD_UP, kPadDpadUp},
    {GLFW_GAMEPAD_BUTTON_DPAD_DOWN, kPadDpadDown},
    {GLFW_GAMEPAD_BUTTON_DPAD_LEFT, kPadDpadLeft},
    {GLFW_GAMEPAD_BUTTON_DPAD_RIGHT, kPadDpadRight},
}};

GlfwPlatform* GetPlatform(GLFWwindow* window) {
    return static_cast<GlfwPlatform*>(glfwGetWindowUserPointer(window));
}

MouseEvent CursorEvent(GLFWwindow* window, MouseButton button) {
    MouseEvent event{button};
    glfwGetCursorPos(window, &event.page_position.x, &event.page_position.y);
    return event;
}

}  // namespace

GlfwPlatform::GlfwPlatform() : GlfwPlatform(Config{}) {}

GlfwPlatform::~GlfwPlatform() {
    // glfwTerminate will destroy any remaining windows
    if (initialized_) {
        glfwTerminate();
    }
}

result<void> GlfwPlatform::MainLoop(MainLoopFn inner_loop) {
    if (!window_) {
        OUTCOME_TRY(InitWindow(1280, 800));
    }

    while (!glfwWindowShouldClose(window_)) {
        glfwPollEvents();

        if (inner_loop) {
            auto res = inner_loop();
            if (res.has_error()) {
                return res.error();
            }
            if (res.value()) {
                break;
            }
        }
    }

    return outcome::success();
}

result<void> GlfwPlatform::InitWindow(int width, int height) {
    if (width <= 0 || height <= 0) {
        return Error::InvalidCanvasSize;
    }

    glfwSetErrorCallback([](int code, const char* description) {
        spdlog::error("GLFW error {}: {}", code, description);
    });

    if (!glfwInit()) {
        return Error::GlfwError;
    }
    initialized_ = true;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    window_ = glfwCreateWindow(width, height, config_.title.c_str(), nullptr,
                               nullptr);
    if (!window_) {
        glfwTerminate();
        initialized_ = false;
        return Error::GlfwWindowCreationFailed;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, KeyCallback);
    glfwSetMouseButtonCallback(window_, MouseButtonCallback);
    glfwSetCursorPosCallback(window_, CursorPosCallback);
    glfwSetScrollCallback(window_, ScrollCallback);
    glfwSetWindowFocusCallback(window_, FocusCallback);

    spdlog::info("Window initialized ({}x{}), canvas {}x{}.", width, height,
                 canvas_width(), canvas_height());

    return outcome::success();
}

uint32_t GlfwPlatform::GetWidth() const {
    if (!window_) {
        return 0;
    }

    int width;
    glfwGetWindowSize(window_, &width, nullptr);
    return static_cast<uint32_t>(width);
};

uint32_t GlfwPlatform::GetHeight() const {
    if (!window_) {
        return 0;
    }

    int height;
    glfwGetWindowSize(window_, nullptr, &height);
    return static_cast<uint32_t>(height);
};

void GlfwPlatform::Sleep(uint32_t microseconds) {
    std::this_thread::sleep_for(std::chrono::microseconds(microseconds));
}

int GlfwPlatform::PageToCanvasX(double page_x) const {
    return WindowToCanvas(page_x, canvas_width(), GetWidth());
}

int GlfwPlatform::PageToCanvasY(double page_y) const {
    return WindowToCanvas(page_y, canvas_height(), GetHeight());
}

bool GlfwPlatform::IsInsideCanvas(int x, int y) const {
    return x >= 0 && x < canvas_width() && y >= 0 && y < canvas_height();
}

std::vector<GamepadSnapshot> GlfwPlatform::PollGamepads() {
    std::vector<GamepadSnapshot> snapshots;

    for (int jid = GLFW_JOYSTICK_1; jid <= GLFW_JOYSTICK_LAST; jid++) {
        GLFWgamepadstate state;
        if (!glfwJoystickIsGamepad(jid) || !glfwGetGamepadState(jid, &state)) {
            continue;
        }

        GamepadSnapshot snapshot{jid, true};
        snapshot.buttons.resize(kPadGuide + 1, false);
        for (const auto& entry : kGlfwToStandardButton) {
            snapshot.buttons[entry.second] =
                state.buttons[entry.first] == GLFW_PRESS;
        }

        // Triggers are axes in GLFW, resting at -1
        snapshot.buttons[kPadLeftTrigger] =
            state.axes[GLFW_GAMEPAD_AXIS_LEFT_TRIGGER] > 0.0f;
        snapshot.buttons[kPadRightTrigger] =
            state.axes[GLFW_GAMEPAD_AXIS_RIGHT_TRIGGER] > 0.0f;

        snapshot.axes = {state.axes[GLFW_GAMEPAD_AXIS_LEFT_X],
                         state.axes[GLFW_GAMEPAD_AXIS_LEFT_Y],
                         state.axes[GLFW_GAMEPAD_AXIS_RIGHT_X],
                         state.axes[GLFW_GAMEPAD_AXIS_RIGHT_Y]};

        snapshots.push_back(std::move(snapshot));
    }

    return snapshots;
}

int GlfwPlatform::canvas_width() const {
    return config_.canvas_width > 0 ? config_.canvas_width
                                    : static_cast<int>(GetWidth());
}

int GlfwPlatform::canvas_height() const {
    return config_.canvas_height > 0 ? config_.canvas_height
                                     : static_cast<int>(GetHeight());
}

void GlfwPlatform::KeyCallback(GLFWwindow* window, int key, int, int action,
                               int) {
    auto platform = GetPlatform(window);
    if (!platform || !platform->handler_) {
        return;
    }

    // Held keys stay held, GLFW_REPEAT carries nothing new
    if (action == GLFW_PRESS) {
        platform->handler_->OnKeyDown(GlfwKeyToKeyCode(key));
    } else if (action == GLFW_RELEASE) {
        platform->handler_->OnKeyUp(GlfwKeyToKeyCode(key));
    }
}

void GlfwPlatform::MouseButtonCallback(GLFWwindow* window, int button,
                                       int action, int) {
    auto platform = GetPlatform(window);
    if (!platform || !platform->handler_) {
        return;
    }

    auto event = CursorEvent(window, GlfwToMouseButton(button));
    if (action == GLFW_PRESS) {
        platform->handler_->OnMouseDown(event);
    } else if (action == GLFW_RELEASE) {
        platform->handler_->OnMouseUp(event);
    }
}

void GlfwPlatform::CursorPosCallback(GLFWwindow* window, double x, double y) {
    auto platform = GetPlatform(window);
    if (!platform || !platform->handler_) {
        return;
    }

    platform->handler_->OnMouseMove({MouseButton::Left, {x, y}});
}

void GlfwPlatform::ScrollCallback(GLFWwindow* window, double x_offset,
                                  double y_offset) {
    auto platform = GetPlatform(window);
    if (!platform || !platform->handler_) {
        return;
    }

    platform->handler_->OnWheel(
        {ScrollToWheelDelta(x_offset, y_offset, platform->config_.wheel_step)});
}

void GlfwPlatform::FocusCallback(GLFWwindow* window, int focused) {
    auto platform = GetPlatform(window);
    if (!platform || !platform->handler_) {
        return;
    }

    if (focused == GLFW_FALSE) {
        platform->handler_->OnFocusLost();
    }
}

}  // namespace tacto
