#include "capture/CaptureRun.hpp"

#include <utility>

#include "capture/PixelConvert.hpp"
#include "platform/Log.hpp"

namespace screenier {

CaptureRun::CaptureRun(ICaptureBackend& backend, IClock& clock,
                       const CaptureConfig& config)
    : backend_(backend),
      config_(config),
      acquirer_(clock, config) {}

bool CaptureRun::open(std::string& err) {
    monitors_ = backend_.listMonitors();
    if (!computeBounds(monitors_, bounds_, err)) {
        return false;
    }
    LOG_DEBUG_IF(config_.debug,
                 "capturing %zu display(s) within %d,%d %d,%d (%dx%d)",
                 monitors_.size(), bounds_.minLeft, bounds_.minTop,
                 bounds_.maxRight, bounds_.maxBottom, bounds_.width(),
                 bounds_.height());

    sessions_.clear();
    sessions_.reserve(monitors_.size());
    for (const auto& monitor : monitors_) {
        std::string sessionErr;
        auto session = backend_.openSession(monitor, sessionErr);
        if (!session) {
            err = "couldn't begin capture on '" + monitor.name + "': " +
                  sessionErr;
            sessions_.clear();
            return false;
        }
        sessions_.push_back(SessionSlot{monitor, std::move(session)});
    }
    assembler_ = std::make_unique<FrameAssembler>(bounds_);
    return true;
}

bool CaptureRun::captureInitial(ImageRGBA& out, std::string& err) {
    return runCycle(nullptr, out, err);
}

bool CaptureRun::captureFollowUp(const ImageRGBA& previous, ImageRGBA& out,
                                 std::string& err) {
    return runCycle(&previous, out, err);
}

bool CaptureRun::runCycle(const ImageRGBA* previous, ImageRGBA& out,
                          std::string& err) {
    if (!assembler_) {
        err = "capture run was not opened";
        return false;
    }
    const bool initial = (previous == nullptr);

    std::vector<DisplayContribution> contributions;
    contributions.reserve(sessions_.size());
    int staleCount = 0;
    for (auto& slot : sessions_) {
        const MonitorInfo& mon = slot.monitor;
        RawFrame raw;
        AcquireResult result =
            initial ? acquirer_.acquireInitial(*slot.session, mon.name, raw,
                                               err)
                    : acquirer_.acquireAnimated(*slot.session, mon.name,
                                                previous != nullptr, raw, err);
        switch (result) {
            case AcquireResult::Captured: {
                if (raw.width != mon.w || raw.height != mon.h) {
                    err = mon.name + ": frame is " + std::to_string(raw.width) +
                          "x" + std::to_string(raw.height) +
                          " but the display is " + std::to_string(mon.w) +
                          "x" + std::to_string(mon.h);
                    return false;
                }
                CapturedRegion region;
                region.left = mon.x;
                region.top = mon.y;
                std::string convertErr;
                if (!convertToRGBA(raw, region.image, convertErr)) {
                    err = mon.name + ": " + convertErr;
                    return false;
                }
                contributions.emplace_back(std::move(region));
                break;
            }
            case AcquireResult::StaleReused:
                ++staleCount;
                contributions.emplace_back(
                    StaleRegion{mon.x, mon.y, mon.w, mon.h});
                break;
            case AcquireResult::Failed:
                return false;
        }
    }

    if (!assembler_->assemble(contributions, previous, out, err)) {
        return false;
    }
    if (staleCount > 0) {
        LOG_DEBUG_IF(config_.debug, "frame reused %d stale region(s)",
                     staleCount);
    }
    return true;
}

bool captureStill(ICaptureBackend& backend, IClock& clock,
                  const CaptureConfig& config, StillCapture& out,
                  std::string& err) {
    CaptureRun run(backend, clock, config);
    if (!run.open(err)) {
        return false;
    }
    StillCapture result;
    if (!run.captureInitial(result.image, err)) {
        return false;
    }
    result.originX = run.bounds().minLeft;
    result.originY = run.bounds().minTop;
    result.monitors = run.monitors();
    out = std::move(result);
    return true;
}

bool captureSequence(ICaptureBackend& backend, IClock& clock,
                     IHoldCondition& hold, const CaptureConfig& config,
                     FrameSequence& out, std::string& err) {
    const IClock::TimePoint runStart = clock.now();

    CaptureRun run(backend, clock, config);
    if (!run.open(err)) {
        return false;
    }

    FrameSequence sequence;
    sequence.originX = run.bounds().minLeft;
    sequence.originY = run.bounds().minTop;
    sequence.monitors = run.monitors();

    ImageRGBA first;
    if (!run.captureInitial(first, err)) {
        return false;
    }
    sequence.frames.push_back(std::move(first));
    IClock::TimePoint prevFrameTime = clock.now();
    sequence.delaysMs.push_back(clampedDelayMs(runStart, prevFrameTime));
    LOG_DEBUG_IF(config.debug, "initial frame after %u ms",
                 static_cast<unsigned>(sequence.delaysMs.back()));

    while (hold.isHeld()) {
        ImageRGBA next;
        if (!run.captureFollowUp(sequence.frames.back(), next, err)) {
            return false;
        }
        sequence.frames.push_back(std::move(next));
        const IClock::TimePoint now = clock.now();
        sequence.delaysMs.push_back(clampedDelayMs(prevFrameTime, now));
        prevFrameTime = now;
        LOG_DEBUG_IF(config.debug, "frame %zu after %u ms",
                     sequence.frames.size() - 1,
                     static_cast<unsigned>(sequence.delaysMs.back()));
    }

    out = std::move(sequence);
    return true;
}

}  // namespace screenier
