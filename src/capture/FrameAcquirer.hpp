#pragma once

#include <string>

#include "capture/CaptureConfig.hpp"
#include "capture/ICaptureBackend.hpp"
#include "platform/Time.hpp"

namespace screenier {

enum class AcquireResult { Captured, StaleReused, Failed };

class FrameAcquirer {
public:
    FrameAcquirer(IClock& clock, const CaptureConfig& config)
        : clock_(clock), config_(config) {}

    // Polls until the session yields a frame. All-zero buffers are treated
    // as not ready. Returns Captured or Failed, never StaleReused.
    AcquireResult acquireInitial(IDisplaySession& session,
                                 const std::string& displayName,
                                 RawFrame& out, std::string& err);

    // Polls at most notReadyRetryThreshold + 1 times. When every poll is
    // not ready the display falls back to its previous region, which is
    // only allowed when hasPrevious is true.
    AcquireResult acquireAnimated(IDisplaySession& session,
                                  const std::string& displayName,
                                  bool hasPrevious, RawFrame& out,
                                  std::string& err);

private:
    IClock& clock_;
    CaptureConfig config_;
};

}  // namespace screenier
