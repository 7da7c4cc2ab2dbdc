#pragma once

#include "input/canvas.hpp"
#include "input/events.hpp"
#include "input/gamepad.hpp"

#include "common/include.hpp"

namespace tacto {

using MainLoopFn = std::function<result<bool>(void)>;

// Host window and event source. The platform maps page coordinates to the
// canvas and is polled for gamepads.
class Platform : public CanvasMapper, public GamepadSource {
  public:
    virtual ~Platform() = default;

    virtual result<void> MainLoop(MainLoopFn inner_loop) = 0;

    virtual uint32_t GetWidth() const = 0;
    virtual uint32_t GetHeight() const = 0;

    virtual result<void> InitWindow(int width, int height) = 0;
    virtual void SetInputEventHandler(InputEventHandler* handler) = 0;

    virtual void Sleep(uint32_t microseconds) = 0;
};

}  // namespace tacto
