#pragma once

#include "common/include.hpp"

namespace tacto {

// Milliseconds on a monotonic clock
using Timestamp = int64_t;
using ClockFn = std::function<Timestamp(void)>;

Timestamp SteadyClockMillis();

}  // namespace tacto
