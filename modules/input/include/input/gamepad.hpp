#pragma once

#include "input/input.hpp"

#include "common/include.hpp"

namespace tacto {

constexpr size_t kMaxGamepads = 16;

// Button indices of the standard gamepad layout
constexpr int kPadA = 0;
constexpr int kPadB = 1;
constexpr int kPadX = 2;
constexpr int kPadY = 3;
constexpr int kPadLeftBumper = 4;
constexpr int kPadRightBumper = 5;
constexpr int kPadLeftTrigger = 6;
constexpr int kPadRightTrigger = 7;
constexpr int kPadBack = 8;
constexpr int kPadStart = 9;
constexpr int kPadLeftThumb = 10;
constexpr int kPadRightThumb = 11;
constexpr int kPadDpadUp = 12;
constexpr int kPadDpadDown = 13;
constexpr int kPadDpadLeft = 14;
constexpr int kPadDpadRight = 15;
constexpr int kPadGuide = 16;

constexpr int kPadAxisLeftX = 0;
constexpr int kPadAxisLeftY = 1;

struct GamepadSnapshot {
    int index{0};
    bool connected{false};
    std::vector<bool> buttons{};
    std::vector<float> axes{};
};

class GamepadSource {
  public:
    virtual ~GamepadSource() = default;

    virtual bool SupportsGamepads() const = 0;
    virtual std::vector<GamepadSnapshot> PollGamepads() = 0;
};

// Last binarized button state of every gamepad slot. Analog sticks are
// folded into the D-pad indices, so that only edges (changed indices) are
// reported back and a still stick cannot override a pressed D-pad.
class GamepadAxisCache {
  public:
    using SlotState = std::array<bool, kGamepadButtonCount>;

    struct Change {
        int button_index;
        bool pressed;
    };

    static SlotState Binarize(const GamepadSnapshot& snapshot,
                              float threshold);

    std::vector<Change> Update(const GamepadSnapshot& snapshot,
                               float threshold);
    std::vector<Change> Disconnect(size_t slot);

    bool is_connected(size_t slot) const {
        return slot < kMaxGamepads && connected_[slot];
    }
    const SlotState& state(size_t slot) const { return current_.at(slot); }

    void Clear();

  private:
    std::vector<Change> Commit(size_t slot, const SlotState& new_state);

    std::array<SlotState, kMaxGamepads> current_{};
    std::array<SlotState, kMaxGamepads> previous_{};
    std::array<bool, kMaxGamepads> connected_{};
};

}  // namespace tacto
