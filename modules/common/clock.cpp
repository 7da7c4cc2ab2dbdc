#include "common/clock.hpp"

namespace tacto {

Timestamp SteadyClockMillis() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

}  // namespace tacto
