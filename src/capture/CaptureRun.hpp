#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "capture/CaptureConfig.hpp"
#include "capture/DisplayLayout.hpp"
#include "capture/FrameAcquirer.hpp"
#include "capture/FrameAssembler.hpp"
#include "capture/ICaptureBackend.hpp"
#include "input/IHoldCondition.hpp"
#include "platform/Time.hpp"

namespace screenier {

struct StillCapture {
    ImageRGBA image;
    int originX = 0;
    int originY = 0;
    std::vector<MonitorInfo> monitors;
};

struct FrameSequence {
    std::vector<ImageRGBA> frames;
    std::vector<std::uint16_t> delaysMs;
    int originX = 0;
    int originY = 0;
    std::vector<MonitorInfo> monitors;
};

// One capture run: the display set, canvas size and capture sessions are
// fixed at open() and held until the run is destroyed.
class CaptureRun {
public:
    CaptureRun(ICaptureBackend& backend, IClock& clock,
               const CaptureConfig& config);

    CaptureRun(const CaptureRun&) = delete;
    CaptureRun& operator=(const CaptureRun&) = delete;

    bool open(std::string& err);

    // One full cycle with unbounded polling and the black-frame filter.
    bool captureInitial(ImageRGBA& out, std::string& err);

    // One full cycle with bounded polling; displays that stay not ready
    // reuse their region of previous.
    bool captureFollowUp(const ImageRGBA& previous, ImageRGBA& out,
                         std::string& err);

    const std::vector<MonitorInfo>& monitors() const {
        return monitors_;
    }
    const DisplayBounds& bounds() const {
        return bounds_;
    }

private:
    struct SessionSlot {
        MonitorInfo monitor;
        std::unique_ptr<IDisplaySession> session;
    };

    bool runCycle(const ImageRGBA* previous, ImageRGBA& out,
                  std::string& err);

    ICaptureBackend& backend_;
    CaptureConfig config_;
    FrameAcquirer acquirer_;
    std::vector<MonitorInfo> monitors_;
    DisplayBounds bounds_;
    std::vector<SessionSlot> sessions_;
    std::unique_ptr<FrameAssembler> assembler_;
};

bool captureStill(ICaptureBackend& backend, IClock& clock,
                  const CaptureConfig& config, StillCapture& out,
                  std::string& err);

// Initial canvas plus one canvas per iteration in which hold reports true.
bool captureSequence(ICaptureBackend& backend, IClock& clock,
                     IHoldCondition& hold, const CaptureConfig& config,
                     FrameSequence& out, std::string& err);

}  // namespace screenier
