#pragma once

#include <string>

#include "capture/CaptureTypes.hpp"

namespace screenier {

// Reorders a native, possibly row-padded buffer into tightly packed RGBA8
// with alpha forced to 255. Rows start at stride * y; padding is skipped.
bool convertToRGBA(const RawFrame& frame, ImageRGBA& out, std::string& err);

bool isAllZero(const RawFrame& frame);

// Derives a PixelLayout from X-style channel masks. Only byte-aligned 8-bit
// channels in 24/32 bpp pixels are representable.
bool layoutFromMasks(int bitsPerPixel, unsigned long redMask,
                     unsigned long greenMask, unsigned long blueMask,
                     bool msbFirst, PixelLayout& out);

}  // namespace screenier
