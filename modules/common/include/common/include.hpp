#pragma once

#include "spdlog/spdlog.h"

#define GLM_FORCE_XYZW_ONLY
#include "glm/glm.hpp"

#include "outcome.hpp"
namespace outcome = OUTCOME_V2_NAMESPACE;
using outcome::result;

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <math.h>
