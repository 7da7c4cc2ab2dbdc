#pragma once

#include "platform/platform.hpp"

#include "common/include.hpp"

struct GLFWwindow;

namespace tacto {

class GlfwPlatform : public Platform {
  public:
    struct Config {
        std::string title{"Tacto"};
        // Logical canvas resolution, 0 follows the window size
        int canvas_width{0};
        int canvas_height{0};
        // Wheel delta reported for one scroll step
        double wheel_step{100.0};
    };

    GlfwPlatform();
    explicit GlfwPlatform(const Config& config) : config_(config) {}
    virtual ~GlfwPlatform() override;

    virtual result<void> MainLoop(MainLoopFn inner_loop) override;

    virtual uint32_t GetWidth() const override;
    virtual uint32_t GetHeight() const override;

    virtual result<void> InitWindow(int width = 1280,
                                    int height = 800) override;
    virtual void SetInputEventHandler(InputEventHandler* handler) override {
        handler_ = handler;
    }

    virtual void Sleep(uint32_t microseconds) override;

    virtual int PageToCanvasX(double page_x) const override;
    virtual int PageToCanvasY(double page_y) const override;
    virtual bool IsInsideCanvas(int x, int y) const override;

    virtual bool SupportsGamepads() const override { return initialized_; }
    virtual std::vector<GamepadSnapshot> PollGamepads() override;

  private:
    Config config_;

    GLFWwindow* window_{nullptr};
    InputEventHandler* handler_{nullptr};
    bool initialized_{false};

    int canvas_width() const;
    int canvas_height() const;

    static void KeyCallback(GLFWwindow* window, int key, int scancode,
                            int action, int mods);
    static void MouseButtonCallback(GLFWwindow* window, int button,
                                    int action, int mods);
    static void CursorPosCallback(GLFWwindow* window, double x, double y);
    static void ScrollCallback(GLFWwindow* window, double x_offset,
                               double y_offset);
    static void FocusCallback(GLFWwindow* window, int focused);
};

}  // namespace tacto
