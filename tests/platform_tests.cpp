#include "platform/glfw_input.hpp"
#include "platform/glfw_platform.hpp"
#include "input/key_map.hpp"

#include "tacto_tests.hpp"

#include <GLFW/glfw3.h>

using namespace tacto;

namespace {

SCENARIO("GLFW keys are translated to virtual key codes", "[platform][keys]") {
    GIVEN("the default key map") {
        auto key_map = DefaultKeyMap();

        auto button_for = [&key_map](int glfw_key) {
            return key_map.Lookup(GlfwKeyToKeyCode(glfw_key));
        };

        THEN("the main keys reach their buttons") {
            CHECK(button_for(GLFW_KEY_TAB) == Button::Tab);
            CHECK(button_for(GLFW_KEY_ENTER) == Button::Ok);
            CHECK(button_for(GLFW_KEY_KP_ENTER) == Button::Ok);
            CHECK(button_for(GLFW_KEY_SPACE) == Button::Ok);
            CHECK(button_for(GLFW_KEY_LEFT_SHIFT) == Button::Shift);
            CHECK(button_for(GLFW_KEY_RIGHT_SHIFT) == Button::Shift);
            CHECK(button_for(GLFW_KEY_LEFT_CONTROL) == Button::Control);
            CHECK(button_for(GLFW_KEY_RIGHT_ALT) == Button::Control);
            CHECK(button_for(GLFW_KEY_ESCAPE) == Button::Escape);
            CHECK(button_for(GLFW_KEY_INSERT) == Button::Escape);
            CHECK(button_for(GLFW_KEY_PAGE_UP) == Button::PageUp);
            CHECK(button_for(GLFW_KEY_PAGE_DOWN) == Button::PageDown);
        }

        THEN("the arrows and the numpad drive the directions") {
            CHECK(button_for(GLFW_KEY_LEFT) == Button::Left);
            CHECK(button_for(GLFW_KEY_UP) == Button::Up);
            CHECK(button_for(GLFW_KEY_RIGHT) == Button::Right);
            CHECK(button_for(GLFW_KEY_DOWN) == Button::Down);
            CHECK(button_for(GLFW_KEY_KP_2) == Button::Down);
            CHECK(button_for(GLFW_KEY_KP_4) == Button::Left);
            CHECK(button_for(GLFW_KEY_KP_6) == Button::Right);
            CHECK(button_for(GLFW_KEY_KP_8) == Button::Up);
            CHECK(button_for(GLFW_KEY_KP_0) == Button::Escape);
        }

        THEN("the letter aliases are bound") {
            CHECK(button_for(GLFW_KEY_Q) == Button::PageUp);
            CHECK(button_for(GLFW_KEY_W) == Button::PageDown);
            CHECK(button_for(GLFW_KEY_X) == Button::Escape);
            CHECK(button_for(GLFW_KEY_Z) == Button::Ok);
            CHECK(button_for(GLFW_KEY_F9) == Button::Debug);
        }
    }

    THEN("special keys keep their virtual key codes") {
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_F9) == 120);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_F1) == 112);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_NUM_LOCK) == kKeyNumLock);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_KP_0) == 96);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_A) == 65);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_5) == 53);
    }

    THEN("keys without a virtual key code are dropped") {
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_WORLD_1) == -1);
        CHECK(GlfwKeyToKeyCode(GLFW_KEY_UNKNOWN) == -1);
    }
}

SCENARIO("GLFW mouse buttons are mapped", "[platform][mouse]") {
    CHECK(GlfwToMouseButton(GLFW_MOUSE_BUTTON_LEFT) == MouseButton::Left);
    CHECK(GlfwToMouseButton(GLFW_MOUSE_BUTTON_MIDDLE) == MouseButton::Middle);
    CHECK(GlfwToMouseButton(GLFW_MOUSE_BUTTON_RIGHT) == MouseButton::Right);
    CHECK(GlfwToMouseButton(GLFW_MOUSE_BUTTON_5) == MouseButton::Other);
}

SCENARIO("scroll offsets become wheel deltas", "[platform][wheel]") {
    GIVEN("the default wheel step") {
        auto step = GlfwPlatform::Config{}.wheel_step;
        REQUIRE(step == 100.0);

        WHEN("the wheel scrolls up one step") {
            auto delta = ScrollToWheelDelta(0.0, 1.0, step);

            THEN("the delta is negative") {
                CHECK(delta.x == 0.0);
                CHECK(delta.y == Approx(-100.0));
            }
        }

        WHEN("the wheel scrolls down two steps") {
            auto delta = ScrollToWheelDelta(0.0, -2.0, step);

            THEN("the delta is positive") {
                CHECK(delta.y == Approx(200.0));
            }
        }

        WHEN("a trackpad scrolls sideways") {
            auto delta = ScrollToWheelDelta(1.5, 0.0, step);

            THEN("the horizontal delta keeps its sign") {
                CHECK(delta.x == Approx(150.0));
                CHECK(delta.y == 0.0);
            }
        }
    }
}

SCENARIO("window coordinates are scaled to the canvas", "[platform][canvas]") {
    THEN("a canvas of the window size is not scaled") {
        CHECK(WindowToCanvas(200.0, 816, 816) == 200);
        CHECK(WindowToCanvas(10.4, 816, 816) == 10);
        CHECK(WindowToCanvas(10.6, 816, 816) == 11);
    }

    THEN("a window twice the canvas size halves the coordinates") {
        CHECK(WindowToCanvas(200.0, 816, 1632) == 100);
        CHECK(WindowToCanvas(201.0, 816, 1632) == 101);
        CHECK(WindowToCanvas(1631.0, 816, 1632) == 816);
    }

    THEN("a window without size leaves coordinates unscaled") {
        CHECK(WindowToCanvas(42.3, 816, 0) == 42);
    }
}

SCENARIO("a GLFW platform can be created without a window",
         "[platform][config]") {
    GIVEN("a default-constructed platform") {
        GlfwPlatform platform;

        THEN("it has no window and no gamepads yet") {
            CHECK(platform.GetWidth() == 0);
            CHECK(platform.GetHeight() == 0);
            CHECK(!platform.SupportsGamepads());
        }
    }

    GIVEN("a platform with an invalid window size") {
        GlfwPlatform::Config config;
        config.title = "Tacto tests";
        GlfwPlatform platform(config);

        THEN("the window is refused before GLFW is touched") {
            auto res = platform.InitWindow(0, 600);
            REQUIRE(res.has_error());
            CHECK(res.error() == Error::InvalidCanvasSize);
        }
    }
}

}  // namespace
