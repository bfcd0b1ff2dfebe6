#pragma once

#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace screenier {

struct DisplayBounds {
    int minLeft = 0;
    int minTop = 0;
    int maxRight = 0;
    int maxBottom = 0;

    int width() const {
        return maxRight - minLeft;
    }
    int height() const {
        return maxBottom - minTop;
    }
};

// Smallest rectangle in global coordinates enclosing every monitor. Fails on
// an empty list or on a monitor with non-positive size.
bool computeBounds(const std::vector<MonitorInfo>& monitors,
                   DisplayBounds& out, std::string& err);

}  // namespace screenier
