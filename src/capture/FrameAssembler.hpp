#pragma once

#include <string>
#include <variant>
#include <vector>

#include "capture/CaptureTypes.hpp"
#include "capture/DisplayLayout.hpp"

namespace screenier {

// Freshly converted pixels for one display, placed at its global origin.
struct CapturedRegion {
    ImageRGBA image;
    int left = 0;
    int top = 0;
};

// A display whose frame did not arrive in time; its rectangle is copied from
// the previous canvas.
struct StaleRegion {
    int left = 0;
    int top = 0;
    int w = 0;
    int h = 0;
};

using DisplayContribution = std::variant<CapturedRegion, StaleRegion>;

class FrameAssembler {
public:
    explicit FrameAssembler(const DisplayBounds& bounds) : bounds_(bounds) {}

    int canvasWidth() const {
        return bounds_.width();
    }
    int canvasHeight() const {
        return bounds_.height();
    }

    // Builds a canvas of the frozen bounds. previous may be null only when no
    // contribution is a StaleRegion.
    bool assemble(const std::vector<DisplayContribution>& contributions,
                  const ImageRGBA* previous, ImageRGBA& out,
                  std::string& err) const;

private:
    bool fitsCanvas(int left, int top, int w, int h) const;

    DisplayBounds bounds_;
};

}  // namespace screenier
