#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "FakeCapture.hpp"
#include "capture/PixelConvert.hpp"

using namespace screenier;

namespace {

// 3x2 BGRX frame with 5 padding bytes per row; every byte has a distinct
// value so misplaced reads show up.
RawFrame paddedPatternFrame() {
    RawFrame frame;
    frame.width = 3;
    frame.height = 2;
    frame.stride = 17;
    frame.layout = kLayoutBgrx8888;
    frame.bytes.assign(static_cast<size_t>(frame.stride) * frame.height, 0xEE);
    std::uint8_t value = 1;
    for (int y = 0; y < frame.height; ++y) {
        for (int x = 0; x < frame.width; ++x) {
            for (int c = 0; c < 4; ++c) {
                frame.bytes[static_cast<size_t>(frame.stride) * y + 4 * x + c] =
                    value++;
            }
        }
    }
    return frame;
}

}  // namespace

TEST(PixelConvertTest, SkipsRowPaddingAndForcesAlpha) {
    RawFrame frame = paddedPatternFrame();
    ImageRGBA out;
    std::string err;
    ASSERT_TRUE(convertToRGBA(frame, out, err)) << err;

    // BGRX bytes (b, g, r, x) become (r, g, b, 255).
    const std::vector<std::uint8_t> expected = {
        3,  2,  1,  255, 7,  6,  5,  255, 11, 10, 9,  255,
        15, 14, 13, 255, 19, 18, 17, 255, 23, 22, 21, 255,
    };
    EXPECT_EQ(out.w, 3);
    EXPECT_EQ(out.h, 2);
    EXPECT_EQ(out.rgba, expected);
    for (auto byte : out.rgba) {
        EXPECT_NE(byte, 0xEE);
    }
}

TEST(PixelConvertTest, OutputIndependentOfPadding) {
    ImageRGBA tight;
    ImageRGBA padded;
    std::string err;
    ASSERT_TRUE(
        convertToRGBA(fakes::solidFrame(5, 4, 10, 20, 30), tight, err));
    ASSERT_TRUE(
        convertToRGBA(fakes::solidFrame(5, 4, 10, 20, 30, 12), padded, err));
    EXPECT_EQ(tight.rgba, padded.rgba);
    EXPECT_EQ(fakes::pixelAt(padded, 4, 3), 0x0A141EFFu);
}

TEST(PixelConvertTest, HonoursRgbxLayout) {
    RawFrame frame;
    frame.width = 1;
    frame.height = 1;
    frame.stride = 4;
    frame.layout = kLayoutRgbx8888;
    frame.bytes = {0x11, 0x22, 0x33, 0x00};
    ImageRGBA out;
    std::string err;
    ASSERT_TRUE(convertToRGBA(frame, out, err)) << err;
    EXPECT_EQ(out.rgba, (std::vector<std::uint8_t>{0x11, 0x22, 0x33, 255}));
}

TEST(PixelConvertTest, HandlesThreeBytePixels) {
    RawFrame frame;
    frame.width = 2;
    frame.height = 2;
    frame.stride = 8;
    frame.layout = PixelLayout{3, 2, 1, 0};
    frame.bytes = {1, 2, 3, 4, 5, 6, 0xEE, 0xEE,
                   7, 8, 9, 10, 11, 12, 0xEE, 0xEE};
    ImageRGBA out;
    std::string err;
    ASSERT_TRUE(convertToRGBA(frame, out, err)) << err;
    EXPECT_EQ(out.rgba, (std::vector<std::uint8_t>{3, 2, 1, 255, 6, 5, 4, 255,
                                                   9, 8, 7, 255, 12, 11, 10,
                                                   255}));
}

TEST(PixelConvertTest, LastRowNeedsNoPadding) {
    RawFrame frame = fakes::solidFrame(2, 2, 1, 2, 3, 8);
    frame.bytes.resize(frame.bytes.size() - 8);
    ImageRGBA out;
    std::string err;
    EXPECT_TRUE(convertToRGBA(frame, out, err)) << err;
}

TEST(PixelConvertTest, RejectsShortBuffer) {
    RawFrame frame = fakes::solidFrame(4, 4, 1, 2, 3);
    frame.bytes.resize(frame.bytes.size() - 1);
    ImageRGBA out;
    std::string err;
    EXPECT_FALSE(convertToRGBA(frame, out, err));
    EXPECT_FALSE(err.empty());
}

TEST(PixelConvertTest, RejectsStrideShorterThanRow) {
    RawFrame frame = fakes::solidFrame(4, 4, 1, 2, 3);
    frame.stride = 12;
    ImageRGBA out;
    std::string err;
    EXPECT_FALSE(convertToRGBA(frame, out, err));
}

TEST(PixelConvertTest, RejectsChannelOutsidePixel) {
    RawFrame frame = fakes::solidFrame(1, 1, 1, 2, 3);
    frame.layout.redOffset = 4;
    ImageRGBA out;
    std::string err;
    EXPECT_FALSE(convertToRGBA(frame, out, err));
}

TEST(PixelConvertTest, DetectsAllZeroBuffers) {
    EXPECT_TRUE(isAllZero(fakes::blackFrame(8, 8)));
    RawFrame frame = fakes::blackFrame(8, 8);
    frame.bytes.back() = 1;
    EXPECT_FALSE(isAllZero(frame));
}

TEST(PixelConvertTest, LayoutFromLsbFirstMasks) {
    PixelLayout layout;
    ASSERT_TRUE(layoutFromMasks(32, 0xFF0000, 0x00FF00, 0x0000FF, false,
                                layout));
    EXPECT_EQ(layout.bytesPerPixel, 4);
    EXPECT_EQ(layout.redOffset, 2);
    EXPECT_EQ(layout.greenOffset, 1);
    EXPECT_EQ(layout.blueOffset, 0);
}

TEST(PixelConvertTest, LayoutFromMsbFirstMasks) {
    PixelLayout layout;
    ASSERT_TRUE(
        layoutFromMasks(32, 0xFF0000, 0x00FF00, 0x0000FF, true, layout));
    EXPECT_EQ(layout.redOffset, 1);
    EXPECT_EQ(layout.greenOffset, 2);
    EXPECT_EQ(layout.blueOffset, 3);
}

TEST(PixelConvertTest, LayoutRejectsPackedFormats) {
    PixelLayout layout;
    EXPECT_FALSE(layoutFromMasks(16, 0xF800, 0x07E0, 0x001F, false, layout));
    EXPECT_FALSE(layoutFromMasks(32, 0x3FF00000, 0x000FFC00, 0x000003FF,
                                 false, layout));
}
