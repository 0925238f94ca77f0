#pragma once
#include "sg/core/value.hpp"

namespace sg {

// max(0, x); gradient 1 for x > 0, 0 otherwise (including x == 0)
Value relu(const Value& x);

} // namespace sg
