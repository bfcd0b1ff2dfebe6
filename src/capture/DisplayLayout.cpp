#include "capture/DisplayLayout.hpp"

#include <algorithm>

namespace screenier {

bool computeBounds(const std::vector<MonitorInfo>& monitors,
                   DisplayBounds& out, std::string& err) {
    if (monitors.empty()) {
        err = "no displays reported";
        return false;
    }
    bool hasBounds = false;
    DisplayBounds bounds;
    for (const auto& mon : monitors) {
        if (mon.w <= 0 || mon.h <= 0) {
            err = "display '" + mon.name + "' has invalid size " +
                  std::to_string(mon.w) + "x" + std::to_string(mon.h);
            return false;
        }
        if (!hasBounds) {
            bounds.minLeft = mon.x;
            bounds.minTop = mon.y;
            bounds.maxRight = mon.right();
            bounds.maxBottom = mon.bottom();
            hasBounds = true;
        } else {
            bounds.minLeft = std::min(bounds.minLeft, mon.x);
            bounds.minTop = std::min(bounds.minTop, mon.y);
            bounds.maxRight = std::max(bounds.maxRight, mon.right());
            bounds.maxBottom = std::max(bounds.maxBottom, mon.bottom());
        }
    }
    out = bounds;
    return true;
}

}  // namespace screenier
