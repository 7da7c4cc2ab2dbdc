#include "tacto_tests.hpp"

#include "input/key_map.hpp"
#include "common/error_codes.hpp"

using namespace tacto;

namespace {

SCENARIO("the default key map binds the standard keys", "[input][keymap]") {
    GIVEN("the default key map") {
        auto key_map = DefaultKeyMap();

        THEN("the main keys map to their buttons") {
            CHECK(key_map.Lookup(9) == Button::Tab);
            CHECK(key_map.Lookup(13) == Button::Ok);
            CHECK(key_map.Lookup(16) == Button::Shift);
            CHECK(key_map.Lookup(17) == Button::Control);
            CHECK(key_map.Lookup(18) == Button::Control);
            CHECK(key_map.Lookup(27) == Button::Escape);
            CHECK(key_map.Lookup(32) == Button::Ok);
            CHECK(key_map.Lookup(33) == Button::PageUp);
            CHECK(key_map.Lookup(34) == Button::PageDown);
            CHECK(key_map.Lookup(37) == Button::Left);
            CHECK(key_map.Lookup(38) == Button::Up);
            CHECK(key_map.Lookup(39) == Button::Right);
            CHECK(key_map.Lookup(40) == Button::Down);
            CHECK(key_map.Lookup(120) == Button::Debug);
        }

        THEN("the letter and numpad aliases are bound") {
            CHECK(key_map.Lookup(81) == Button::PageUp);
            CHECK(key_map.Lookup(87) == Button::PageDown);
            CHECK(key_map.Lookup(88) == Button::Escape);
            CHECK(key_map.Lookup(90) == Button::Ok);
            CHECK(key_map.Lookup(45) == Button::Escape);
            CHECK(key_map.Lookup(96) == Button::Escape);
            CHECK(key_map.Lookup(98) == Button::Down);
            CHECK(key_map.Lookup(100) == Button::Left);
            CHECK(key_map.Lookup(102) == Button::Right);
            CHECK(key_map.Lookup(104) == Button::Up);
        }

        THEN("other codes are unmapped") {
            CHECK(key_map.Lookup(65) == Button::None);
            CHECK(key_map.Lookup(kKeyNumLock) == Button::None);
            CHECK(key_map.Lookup(-1) == Button::None);
            CHECK(key_map.Lookup(256) == Button::None);
            CHECK(key_map.mapped_count() == DefaultKeyBindings().size());
        }
    }

    GIVEN("the default gamepad map") {
        auto gamepad_map = DefaultGamepadMap();

        THEN("the standard layout is bound") {
            CHECK(gamepad_map.Lookup(kPadA) == Button::Ok);
            CHECK(gamepad_map.Lookup(kPadB) == Button::Cancel);
            CHECK(gamepad_map.Lookup(kPadX) == Button::Shift);
            CHECK(gamepad_map.Lookup(kPadY) == Button::Menu);
            CHECK(gamepad_map.Lookup(kPadLeftBumper) == Button::PageUp);
            CHECK(gamepad_map.Lookup(kPadRightBumper) == Button::PageDown);
            CHECK(gamepad_map.Lookup(kPadDpadUp) == Button::Up);
            CHECK(gamepad_map.Lookup(kPadDpadDown) == Button::Down);
            CHECK(gamepad_map.Lookup(kPadDpadLeft) == Button::Left);
            CHECK(gamepad_map.Lookup(kPadDpadRight) == Button::Right);
            CHECK(gamepad_map.Lookup(kPadStart) == Button::None);
            CHECK(gamepad_map.mapped_count() == 10);
        }
    }
}

SCENARIO("invalid mappings are rejected", "[input][keymap][error]") {
    WHEN("a key is bound twice") {
        auto res = KeyMap::Create({{13, Button::Ok}, {13, Button::Escape}});

        THEN("creation fails") {
            REQUIRE(res.has_error());
            CHECK(res.error() == Error::DuplicateMapping);
            CHECK(res.error().message() == "code is mapped more than once");
        }
    }

    WHEN("a key code is out of range") {
        auto res = KeyMap::Create({{300, Button::Ok}});

        THEN("creation fails") {
            REQUIRE(res.has_error());
            CHECK(res.error() == Error::InvalidKeyCode);
        }
    }

    WHEN("a binding has no target button") {
        auto res = KeyMap::Create({{13, Button::None}});

        THEN("creation fails") {
            REQUIRE(res.has_error());
            CHECK(res.error() == Error::InvalidMapping);
        }
    }

    WHEN("a gamepad button index is out of range") {
        auto res = GamepadMap::Create({{40, Button::Ok}});

        THEN("creation fails with a gamepad error") {
            REQUIRE(res.has_error());
            CHECK(res.error() == Error::InvalidGamepadButton);
            CHECK(res.error().category().name() == std::string("TactoError"));
        }
    }

    WHEN("several keys share a button") {
        TACTO_TEST_TRY(key_map,
                       KeyMap::Create({{13, Button::Ok}, {32, Button::Ok}}));

        THEN("creation succeeds") {
            CHECK(key_map.Lookup(13) == Button::Ok);
            CHECK(key_map.Lookup(32) == Button::Ok);
            CHECK(key_map.mapped_count() == 2);
        }
    }
}

SCENARIO("buttons can be looked up by name", "[input][keymap][names]") {
    THEN("every button round-trips through its name") {
        for (size_t i = 0; i < kButtonCount; i++) {
            auto button = static_cast<Button>(i);
            CHECK(ButtonFromName(ButtonName(button)) == button);
        }
    }

    THEN("names are lowercase") {
        CHECK(std::string(ButtonName(Button::PageDown)) == "pagedown");
        CHECK(std::string(ButtonName(Button::Ok)) == "ok");
        CHECK(std::string(ButtonName(Button::None)) == "none");
    }

    THEN("unknown names map to no button") {
        CHECK(ButtonFromName("jump") == Button::None);
        CHECK(ButtonFromName("") == Button::None);
        CHECK(ButtonFromName("OK") == Button::None);
    }
}

}  // namespace
