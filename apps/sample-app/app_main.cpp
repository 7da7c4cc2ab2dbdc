#include "engine/engine.hpp"

#include <stdexcept>

int main() {
    spdlog::set_level(spdlog::level::debug);

    try {
        tacto::Engine engine;
        int last_dir8 = 0;

        auto res = engine.MainLoop([&]() -> result<bool> {
            const auto& keyboard = engine.input_system().keyboard();
            const auto& pointer = engine.input_system().pointer();

            if (keyboard.IsTriggered(tacto::Button::Ok)) {
                spdlog::info("ok triggered");
            }
            if (keyboard.IsRepeated(tacto::Button::PageDown)) {
                spdlog::info("pagedown repeated ({} frames held)",
                             keyboard.pressed_frames());
            }
            if (keyboard.dir8() != last_dir8) {
                spdlog::info("dir4 {} dir8 {}", keyboard.dir4(),
                             keyboard.dir8());
                last_dir8 = keyboard.dir8();
            }

            if (pointer.IsTriggered()) {
                spdlog::info("pointer triggered at {}, {}", pointer.x(),
                             pointer.y());
            }
            if (pointer.IsCancelled()) {
                spdlog::info("pointer cancelled at {}, {}", pointer.x(),
                             pointer.y());
            }
            if (pointer.IsLongPressed() && pointer.IsRepeated()) {
                spdlog::info("pointer long press repeat at {}, {}",
                             pointer.x(), pointer.y());
            }
            if (pointer.wheel_y() != 0.0) {
                spdlog::info("wheel {}", pointer.wheel_y());
            }

            // Hold escape (or B on a gamepad) to quit
            return keyboard.IsLongPressed(tacto::Button::Cancel);
        });

        if (res.has_error()) {
            spdlog::error(res.error().message());
            return 1;
        }
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
