#pragma once

#include "input/input_system.hpp"
#include "platform/platform.hpp"

#include "common/include.hpp"

namespace tacto {

class Engine {
  public:
    struct Config {
        int window_width{1280};
        int window_height{800};
        uint32_t fps_cap{60};
        InputSystem::Config input{};
    };

    Engine();
    explicit Engine(const Config& config);
    explicit Engine(std::unique_ptr<Platform> platform);
    Engine(std::unique_ptr<Platform> platform, const Config& config);

    // Runs the frame loop. Input is acquired exactly once per frame, before
    // inner_fn; inner_fn returning true ends the loop.
    result<void> MainLoop(MainLoopFn inner_fn);

    Platform& platform() { return *platform_.get(); }
    InputSystem& input_system() { return *input_system_.get(); }

    uint32_t frame_count() { return frame_count_; }
    float delta_time() { return delta_time_.count(); }

  private:
    Config config_;

    std::unique_ptr<Platform> platform_{};
    std::unique_ptr<InputSystem> input_system_{};

    uint32_t frame_count_{0};

    std::chrono::duration<float> delta_time_{0.0f};
    std::chrono::time_point<std::chrono::high_resolution_clock>
        frame_timestamp_{std::chrono::high_resolution_clock::now()};
};

}  // namespace tacto
