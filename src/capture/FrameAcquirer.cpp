#include "capture/FrameAcquirer.hpp"

#include <utility>

#include "capture/PixelConvert.hpp"
#include "platform/Log.hpp"

namespace screenier {

AcquireResult FrameAcquirer::acquireInitial(IDisplaySession& session,
                                            const std::string& displayName,
                                            RawFrame& out, std::string& err) {
    long notReady = 0;
    long blackFrames = 0;
    for (;;) {
        FrameAttempt attempt = session.tryFrame();
        switch (attempt.status) {
            case FrameStatus::Ready:
                // Some backends hand out an all-black buffer right after the
                // session starts.
                if (isAllZero(attempt.frame)) {
                    ++blackFrames;
                    LOG_DEBUG_IF(config_.debug, "%s: black frame (%ld)",
                                 displayName.c_str(), blackFrames);
                    break;
                }
                LOG_DEBUG_IF(config_.debug,
                             "%s: initial frame after %ld not-ready, %ld black",
                             displayName.c_str(), notReady, blackFrames);
                out = std::move(attempt.frame);
                return AcquireResult::Captured;
            case FrameStatus::NotReady:
                ++notReady;
                break;
            case FrameStatus::Fatal:
                err = displayName + ": " + attempt.error;
                return AcquireResult::Failed;
        }
        clock_.sleepFor(config_.initialRetryPause);
    }
}

AcquireResult FrameAcquirer::acquireAnimated(IDisplaySession& session,
                                             const std::string& displayName,
                                             bool hasPrevious, RawFrame& out,
                                             std::string& err) {
    int notReady = 0;
    for (;;) {
        FrameAttempt attempt = session.tryFrame();
        switch (attempt.status) {
            case FrameStatus::Ready:
                out = std::move(attempt.frame);
                return AcquireResult::Captured;
            case FrameStatus::NotReady:
                ++notReady;
                LOG_DEBUG_IF(config_.debug, "%s: would block (%d)",
                             displayName.c_str(), notReady);
                if (notReady > config_.notReadyRetryThreshold) {
                    if (!hasPrevious) {
                        err = displayName +
                              ": no frame available and nothing to fall "
                              "back to";
                        return AcquireResult::Failed;
                    }
                    LOG_DEBUG_IF(config_.debug,
                                 "%s: reusing previous region",
                                 displayName.c_str());
                    return AcquireResult::StaleReused;
                }
                break;
            case FrameStatus::Fatal:
                err = displayName + ": " + attempt.error;
                return AcquireResult::Failed;
        }
    }
}

}  // namespace screenier
