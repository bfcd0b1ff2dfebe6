#include "capture/PixelConvert.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace screenier {

namespace {

bool channelByte(unsigned long mask, int bytesPerPixel, bool msbFirst,
                 int& out) {
    if (mask == 0) {
        return false;
    }
    const int shift = __builtin_ctzl(mask);
    if (shift % 8 != 0 || (mask >> shift) != 0xFFul) {
        return false;
    }
    const int byteIndex = shift / 8;
    if (byteIndex >= bytesPerPixel) {
        return false;
    }
    out = msbFirst ? (bytesPerPixel - 1 - byteIndex) : byteIndex;
    return true;
}

}  // namespace

bool convertToRGBA(const RawFrame& frame, ImageRGBA& out, std::string& err) {
    const PixelLayout& layout = frame.layout;
    if (frame.width <= 0 || frame.height <= 0) {
        err = "raw frame has empty geometry";
        return false;
    }
    if (layout.bytesPerPixel <= 0 ||
        std::max({layout.redOffset, layout.greenOffset, layout.blueOffset}) >=
            layout.bytesPerPixel ||
        std::min({layout.redOffset, layout.greenOffset, layout.blueOffset}) <
            0) {
        err = "raw frame has an invalid pixel layout";
        return false;
    }
    const size_t width = static_cast<size_t>(frame.width);
    const size_t height = static_cast<size_t>(frame.height);
    const size_t bpp = static_cast<size_t>(layout.bytesPerPixel);
    const size_t stride = static_cast<size_t>(frame.stride);
    if (frame.stride < 0 || stride < width * bpp) {
        err = "raw frame stride is smaller than one row of pixels";
        return false;
    }
    // The last row only needs its pixels, not its trailing padding.
    if (frame.bytes.size() < stride * (height - 1) + width * bpp) {
        err = "raw frame buffer is shorter than its geometry";
        return false;
    }

    out.w = frame.width;
    out.h = frame.height;
    out.rgba.resize(width * height * 4u);

    const std::uint8_t* src = frame.bytes.data();
    std::uint8_t* dst = out.rgba.data();
    for (size_t y = 0; y < height; ++y) {
        const std::uint8_t* row = src + stride * y;
        for (size_t x = 0; x < width; ++x) {
            const std::uint8_t* pixel = row + bpp * x;
            dst[0] = pixel[layout.redOffset];
            dst[1] = pixel[layout.greenOffset];
            dst[2] = pixel[layout.blueOffset];
            dst[3] = 255;
            dst += 4;
        }
    }
    return true;
}

bool isAllZero(const RawFrame& frame) {
    return std::all_of(frame.bytes.begin(), frame.bytes.end(),
                       [](std::uint8_t b) { return b == 0; });
}

bool layoutFromMasks(int bitsPerPixel, unsigned long redMask,
                     unsigned long greenMask, unsigned long blueMask,
                     bool msbFirst, PixelLayout& out) {
    if (bitsPerPixel != 24 && bitsPerPixel != 32) {
        return false;
    }
    PixelLayout layout;
    layout.bytesPerPixel = bitsPerPixel / 8;
    if (!channelByte(redMask, layout.bytesPerPixel, msbFirst,
                     layout.redOffset) ||
        !channelByte(greenMask, layout.bytesPerPixel, msbFirst,
                     layout.greenOffset) ||
        !channelByte(blueMask, layout.bytesPerPixel, msbFirst,
                     layout.blueOffset)) {
        return false;
    }
    out = layout;
    return true;
}

}  // namespace screenier
