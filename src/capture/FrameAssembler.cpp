#include "capture/FrameAssembler.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace screenier {

namespace {

void copyRect(const std::uint8_t* src, size_t srcStride, std::uint8_t* dst,
              size_t dstStride, size_t rowBytes, size_t rows) {
    for (size_t y = 0; y < rows; ++y) {
        std::copy_n(src + srcStride * y, rowBytes, dst + dstStride * y);
    }
}

size_t pixelOffset(int x, int y, int width) {
    return (static_cast<size_t>(y) * static_cast<size_t>(width) +
            static_cast<size_t>(x)) *
           4u;
}

}  // namespace

bool FrameAssembler::fitsCanvas(int left, int top, int w, int h) const {
    const int x = left - bounds_.minLeft;
    const int y = top - bounds_.minTop;
    return w > 0 && h > 0 && x >= 0 && y >= 0 && x + w <= canvasWidth() &&
           y + h <= canvasHeight();
}

bool FrameAssembler::assemble(
    const std::vector<DisplayContribution>& contributions,
    const ImageRGBA* previous, ImageRGBA& out, std::string& err) const {
    const int width = canvasWidth();
    const int height = canvasHeight();
    const size_t canvasStride = static_cast<size_t>(width) * 4u;

    ImageRGBA canvas;
    canvas.w = width;
    canvas.h = height;
    canvas.rgba.assign(canvasStride * static_cast<size_t>(height), 0);

    struct Placer {
        const FrameAssembler& self;
        const ImageRGBA* previous;
        ImageRGBA& canvas;
        size_t canvasStride;
        std::string& err;

        bool operator()(const CapturedRegion& region) const {
            const ImageRGBA& image = region.image;
            if (image.rgba.size() != static_cast<size_t>(image.w) *
                                         static_cast<size_t>(image.h) * 4u) {
                err = "captured region has inconsistent pixel data";
                return false;
            }
            if (!self.fitsCanvas(region.left, region.top, image.w, image.h)) {
                err = "captured region " + std::to_string(image.w) + "x" +
                      std::to_string(image.h) + " at " +
                      std::to_string(region.left) + "," +
                      std::to_string(region.top) + " lies outside the canvas";
                return false;
            }
            const int x = region.left - self.bounds_.minLeft;
            const int y = region.top - self.bounds_.minTop;
            copyRect(image.rgba.data(), static_cast<size_t>(image.w) * 4u,
                     canvas.rgba.data() + pixelOffset(x, y, canvas.w),
                     canvasStride, static_cast<size_t>(image.w) * 4u,
                     static_cast<size_t>(image.h));
            return true;
        }

        bool operator()(const StaleRegion& region) const {
            if (!previous || previous->w != canvas.w ||
                previous->h != canvas.h) {
                err = "stale region requested without a matching previous "
                      "canvas";
                return false;
            }
            if (!self.fitsCanvas(region.left, region.top, region.w,
                                 region.h)) {
                err = "stale region lies outside the canvas";
                return false;
            }
            const int x = region.left - self.bounds_.minLeft;
            const int y = region.top - self.bounds_.minTop;
            const size_t offset = pixelOffset(x, y, canvas.w);
            copyRect(previous->rgba.data() + offset, canvasStride,
                     canvas.rgba.data() + offset, canvasStride,
                     static_cast<size_t>(region.w) * 4u,
                     static_cast<size_t>(region.h));
            return true;
        }
    };

    const Placer placer{*this, previous, canvas, canvasStride, err};
    for (const auto& contribution : contributions) {
        if (!std::visit(placer, contribution)) {
            return false;
        }
    }
    out = std::move(canvas);
    return true;
}

}  // namespace screenier
