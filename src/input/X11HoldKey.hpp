#pragma once

#include <memory>

#include "input/IHoldCondition.hpp"

namespace screenier {

// Held while either Shift key is down, sampled from the X server keymap.
std::unique_ptr<IHoldCondition> CreateX11HoldKey();

}  // namespace screenier
