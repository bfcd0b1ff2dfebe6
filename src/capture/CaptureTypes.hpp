#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace screenier {

struct ImageRGBA {
    int w = 0;
    int h = 0;
    std::vector<std::uint8_t> rgba;
};

struct MonitorInfo {
    std::string name;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    float scale = 1.0f;
    bool primary = false;

    int right() const {
        return x + w;
    }
    int bottom() const {
        return y + h;
    }
};

// Byte positions of each colour channel inside one native pixel.
struct PixelLayout {
    int bytesPerPixel = 4;
    int redOffset = 2;
    int greenOffset = 1;
    int blueOffset = 0;
};

// BGRX/BGRA in memory, the usual little-endian 32 bpp framebuffer order.
inline constexpr PixelLayout kLayoutBgrx8888{4, 2, 1, 0};
inline constexpr PixelLayout kLayoutRgbx8888{4, 0, 1, 2};

struct RawFrame {
    int width = 0;
    int height = 0;
    int stride = 0;
    PixelLayout layout{};
    std::vector<std::uint8_t> bytes;
};

enum class FrameStatus { Ready, NotReady, Fatal };

struct FrameAttempt {
    FrameStatus status = FrameStatus::NotReady;
    RawFrame frame;
    std::string error;

    static FrameAttempt ready(RawFrame frame) {
        FrameAttempt attempt;
        attempt.status = FrameStatus::Ready;
        attempt.frame = std::move(frame);
        return attempt;
    }
    static FrameAttempt notReady() {
        return FrameAttempt{};
    }
    static FrameAttempt fatal(std::string error) {
        FrameAttempt attempt;
        attempt.status = FrameStatus::Fatal;
        attempt.error = std::move(error);
        return attempt;
    }
};

}  // namespace screenier
