#include "engine/engine.hpp"

#include "common/error_codes.hpp"
#include "platform/glfw_platform.hpp"

#include <stdexcept>

namespace tacto {

Engine::Engine() : Engine(Config{}) {}

Engine::Engine(std::unique_ptr<Platform> platform)
    : Engine(std::move(platform), Config{}) {}

Engine::Engine(const Config& config)
    : Engine(std::make_unique<GlfwPlatform>(), config) {}

Engine::Engine(std::unique_ptr<Platform> platform, const Config& config)
    : config_(config),
      platform_(std::move(platform)),
      input_system_(std::make_unique<InputSystem>(*platform_.get(),
                                                  platform_.get())) {
    auto res =
        platform_->InitWindow(config_.window_width, config_.window_height);
    if (res.has_error()) {
        throw std::runtime_error(res.error().message());
    }

    res = input_system_->Initialize(config_.input);
    if (res.has_error()) {
        throw std::runtime_error(res.error().message());
    }

    platform_->SetInputEventHandler(input_system_.get());
}

result<void> Engine::MainLoop(MainLoopFn inner_loop) {
    if (platform_) {
        OUTCOME_TRY(platform_->MainLoop([&]() -> result<bool> {
            if (config_.fps_cap > 0) {
                // Limit FPS
                std::chrono::duration<float> elapsed =
                    std::chrono::high_resolution_clock::now() -
                    frame_timestamp_;

                auto min_frame_time = 1.0f / config_.fps_cap;
                if (elapsed.count() < min_frame_time) {
                    auto wait_us = 1e6 * (min_frame_time - elapsed.count());
                    platform_->Sleep(static_cast<uint32_t>(wait_us));
                }
            }

            auto now = std::chrono::high_resolution_clock::now();
            delta_time_ = now - frame_timestamp_;
            frame_timestamp_ = now;

            OUTCOME_TRY(input_system_->AcquireFrameInput());

            bool should_terminate = false;
            if (inner_loop) {
                // Inner loop allows for conditional termination
                auto res = inner_loop();
                if (res.has_error()) {
                    return res.error();
                }
                should_terminate = res.value();
            }

            frame_count_++;
            return should_terminate;
        }));
    }

    return outcome::success();
};

}  // namespace tacto
