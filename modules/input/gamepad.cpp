#include "input/gamepad.hpp"

namespace tacto {

GamepadAxisCache::SlotState GamepadAxisCache::Binarize(
    const GamepadSnapshot& snapshot, float threshold) {
    SlotState state{};

    auto button_count = std::min(snapshot.buttons.size(), state.size());
    for (size_t i = 0; i < button_count; i++) {
        state[i] = snapshot.buttons[i];
    }

    auto axis = [&snapshot](int index) {
        return static_cast<size_t>(index) < snapshot.axes.size()
                   ? snapshot.axes[index]
                   : 0.0f;
    };

    // Sticks only ever add to the D-pad
    auto y = axis(kPadAxisLeftY);
    if (y < -threshold) {
        state[kPadDpadUp] = true;
    } else if (y > threshold) {
        state[kPadDpadDown] = true;
    }

    auto x = axis(kPadAxisLeftX);
    if (x < -threshold) {
        state[kPadDpadLeft] = true;
    } else if (x > threshold) {
        state[kPadDpadRight] = true;
    }

    return state;
}

std::vector<GamepadAxisCache::Change> GamepadAxisCache::Update(
    const GamepadSnapshot& snapshot, float threshold) {
    if (snapshot.index < 0 ||
        static_cast<size_t>(snapshot.index) >= kMaxGamepads) {
        return {};
    }

    auto slot = static_cast<size_t>(snapshot.index);
    if (!connected_[slot]) {
        spdlog::debug("Gamepad {} connected.", slot);
        connected_[slot] = true;
    }

    return Commit(slot, Binarize(snapshot, threshold));
}

std::vector<GamepadAxisCache::Change> GamepadAxisCache::Disconnect(
    size_t slot) {
    if (!is_connected(slot)) {
        return {};
    }

    spdlog::debug("Gamepad {} disconnected.", slot);
    connected_[slot] = false;

    return Commit(slot, SlotState{});
}

void GamepadAxisCache::Clear() {
    for (auto& state : current_) {
        state.fill(false);
    }
    for (auto& state : previous_) {
        state.fill(false);
    }
    connected_.fill(false);
}

std::vector<GamepadAxisCache::Change> GamepadAxisCache::Commit(
    size_t slot, const SlotState& new_state) {
    previous_[slot] = current_[slot];
    current_[slot] = new_state;

    std::vector<Change> changes;
    const auto& last_state = previous_[slot];
    for (size_t i = 0; i < new_state.size(); i++) {
        if (new_state[i] != last_state[i]) {
            changes.push_back({static_cast<int>(i), new_state[i]});
        }
    }

    return changes;
}

}  // namespace tacto
