#pragma once

#include <chrono>

namespace screenier {

struct CaptureConfig {
    // Consecutive not-ready polls tolerated per display in an animated cycle
    // before that display reuses its previous region.
    int notReadyRetryThreshold = 20;
    // Pause between polls while waiting for the initial frame.
    std::chrono::microseconds initialRetryPause{100};
    bool debug = false;
};

}  // namespace screenier
