#pragma once

#include "input/input.hpp"

#include "common/include.hpp"
#include "common/error_codes.hpp"

namespace tacto {

// Immutable table from a raw code (key code or gamepad button index) to a
// logical button. Codes without a binding map to Button::None.
template <size_t N, Error RangeError>
class ButtonMap {
  public:
    struct Binding {
        int code;
        Button button;
    };

    ButtonMap() { table_.fill(Button::None); }

    static result<ButtonMap> Create(const std::vector<Binding>& bindings) {
        ButtonMap map;

        for (const auto& binding : bindings) {
            if (binding.code < 0 || static_cast<size_t>(binding.code) >= N) {
                return RangeError;
            }
            if (binding.button == Button::None) {
                return Error::InvalidMapping;
            }

            auto& entry = map.table_[binding.code];
            if (entry != Button::None) {
                return Error::DuplicateMapping;
            }
            entry = binding.button;
        }

        return map;
    }

    Button Lookup(int code) const {
        if (code < 0 || static_cast<size_t>(code) >= N) {
            return Button::None;
        }
        return table_[code];
    }

    size_t mapped_count() const {
        return std::count_if(table_.begin(), table_.end(),
                             [](Button b) { return b != Button::None; });
    }

    static constexpr size_t size() { return N; }

  private:
    std::array<Button, N> table_{};
};

using KeyMap = ButtonMap<kKeyCodeCount, Error::InvalidKeyCode>;
using GamepadMap = ButtonMap<kGamepadButtonCount, Error::InvalidGamepadButton>;

const std::vector<KeyMap::Binding>& DefaultKeyBindings();
const std::vector<GamepadMap::Binding>& DefaultGamepadBindings();

KeyMap DefaultKeyMap();
GamepadMap DefaultGamepadMap();

}  // namespace tacto
