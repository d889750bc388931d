#include <gtest/gtest.h>
#include <cstring>
#include <vector>

#include "xicam_ng/FrameView.hpp"

using xicam_ng::FrameView;

namespace {

XI_IMG make_image(void* buf, XI_IMG_FORMAT fmt, uint32_t w, uint32_t h,
                  uint32_t padding, uint32_t bp_size)
{
    XI_IMG img;
    std::memset(&img, 0, sizeof(img));
    img.size = sizeof(XI_IMG);
    img.bp = buf;
    img.bp_size = bp_size;
    img.frm = fmt;
    img.width = w;
    img.height = h;
    img.padding_x = padding;
    return img;
}

template <typename T>
FrameView<T> view_over(const XI_IMG& img)
{
    return FrameView<T>::over(img, img.bp);
}

}  // namespace

// Each row is width*channels elements plus padding_x bytes; the padding must be skipped.
TEST(FrameView, PixelAddressSkipsRowPadding) {
    // 3x2 MONO8 with 2 bytes of padding per row, padding filled with a sentinel.
    std::vector<uint8_t> buf = {
        10, 11, 12, 0xEE, 0xEE,
        20, 21, 22, 0xEE, 0xEE,
    };
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_MONO8, 3, 2, 2, 10));

    ASSERT_TRUE(view.valid());
    EXPECT_EQ(view.stride_bytes(), 5u);
    EXPECT_EQ(*view.pixel(0, 0), 10);
    EXPECT_EQ(*view.pixel(2, 0), 12);
    EXPECT_EQ(*view.pixel(0, 1), 20);
    EXPECT_EQ(*view.pixel(2, 1), 22);
}

// Multi-byte elements scale the stride by sizeof(T).
TEST(FrameView, SixteenBitPixels) {
    // 2x2 MONO16, 4 bytes of padding: stride = 2*2 + 4 = 8 bytes.
    std::vector<uint16_t> buf = {100, 101, 0xEEEE, 0xEEEE, 200, 201, 0xEEEE, 0xEEEE};
    auto view = view_over<uint16_t>(make_image(buf.data(), XI_MONO16, 2, 2, 4, 16));

    EXPECT_EQ(view.channels(), 1u);
    EXPECT_EQ(*view.pixel(1, 0), 101);
    EXPECT_EQ(*view.pixel(0, 1), 200);
    EXPECT_EQ(*view.pixel(1, 1), 201);
}

// Interleaved RGB: pixel() points at the first channel of the pixel.
TEST(FrameView, RgbPixelPointsAtFirstChannel) {
    // 2x2 RGB24, 2 bytes padding: stride = 2*3 + 2 = 8.
    std::vector<uint8_t> buf(16, 0xEE);
    buf[8 + 3] = 7; buf[8 + 4] = 8; buf[8 + 5] = 9;
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_RGB24, 2, 2, 2, 16));

    EXPECT_EQ(view.channels(), 3u);
    const uint8_t* p = view.pixel(1, 1);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p[0], 7);
    EXPECT_EQ(p[1], 8);
    EXPECT_EQ(p[2], 9);
    EXPECT_EQ(p - buf.data(), 11);
}

// Coordinates at or past width/height return nullptr, never an address.
TEST(FrameView, OutOfRangeIsNull) {
    std::vector<uint8_t> buf(4 * 3, 1);
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_MONO8, 4, 3, 0, 12));

    EXPECT_NE(view.pixel(3, 2), nullptr);
    EXPECT_EQ(view.pixel(4, 0), nullptr);
    EXPECT_EQ(view.pixel(0, 3), nullptr);
    EXPECT_EQ(view.pixel(1000, 1000), nullptr);
}

// A null buffer never resolves.
TEST(FrameView, NullBuffer) {
    auto view = view_over<uint8_t>(make_image(nullptr, XI_MONO8, 4, 4, 0, 16));
    EXPECT_FALSE(view.valid());
    EXPECT_EQ(view.pixel(0, 0), nullptr);
    EXPECT_TRUE(view.data().empty());

    FrameView<uint8_t> empty;
    EXPECT_FALSE(empty.valid());
    EXPECT_EQ(empty.width(), 0u);
}

// data() uses bp_size when the driver reported one, else width*height*channels.
TEST(FrameView, DataLength) {
    std::vector<uint8_t> buf(64, 0);

    auto sized = view_over<uint8_t>(make_image(buf.data(), XI_MONO8, 4, 4, 2, 24));
    EXPECT_EQ(sized.data().size(), 24u);

    auto unsized = view_over<uint8_t>(make_image(buf.data(), XI_RGB24, 4, 2, 0, 0));
    EXPECT_EQ(unsized.data().size(), 4u * 2u * 3u);

    auto wide = view_over<uint16_t>(make_image(buf.data(), XI_MONO16, 4, 4, 0, 32));
    EXPECT_EQ(wide.data().size(), 16u);
    EXPECT_EQ(wide.data().at(16), nullptr);
}

// Formats without a known channel layout report 0 channels, no data and no pixels.
TEST(FrameView, UnknownFormat) {
    std::vector<uint8_t> buf(16, 0);
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_RGB_PLANAR, 2, 2, 0, 16));
    EXPECT_EQ(view.channels(), 0u);
    EXPECT_TRUE(view.data().empty());
    EXPECT_EQ(view.pixel(0, 0), nullptr);
    EXPECT_EQ(view.pixel(1, 1), nullptr);
}

// A 16-bit view over an 8-bit frame resolves nothing instead of reading past the buffer.
TEST(FrameView, ElementTypeMustMatchFormat) {
    std::vector<uint8_t> buf(640 * 480, 0);
    auto wide = view_over<uint16_t>(make_image(buf.data(), XI_MONO8, 640, 480, 0, 640 * 480));
    EXPECT_TRUE(wide.valid());
    EXPECT_EQ(wide.pixel(0, 0), nullptr);
    EXPECT_EQ(wide.pixel(639, 479), nullptr);
    EXPECT_TRUE(wide.data().empty());

    std::vector<uint16_t> buf16(4 * 4, 0);
    auto narrow = view_over<uint8_t>(make_image(buf16.data(), XI_MONO16, 4, 4, 0, 32));
    EXPECT_EQ(narrow.pixel(3, 3), nullptr);
    EXPECT_TRUE(narrow.data().empty());
}

// A reported bp_size smaller than the geometry bounds the addresses pixel() hands out.
TEST(FrameView, PixelStaysInsideReportedSize) {
    std::vector<uint8_t> buf(8, 0);
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_MONO8, 4, 4, 0, 8));
    EXPECT_NE(view.pixel(3, 1), nullptr);
    EXPECT_EQ(view.pixel(0, 2), nullptr);
    EXPECT_EQ(view.pixel(3, 3), nullptr);
}

// header() hands out the layout only; a view over it needs memory passed explicitly.
TEST(FrameView, HeaderDropsBufferPointer) {
    std::vector<uint8_t> buf(4, 9);
    auto view = view_over<uint8_t>(make_image(buf.data(), XI_MONO8, 2, 2, 0, 4));
    XI_IMG hdr = view.header();
    EXPECT_EQ(hdr.bp, nullptr);
    EXPECT_EQ(hdr.width, 2u);
    EXPECT_FALSE(FrameView<uint8_t>::over(hdr, nullptr).valid());
    EXPECT_EQ(*FrameView<uint8_t>::over(hdr, buf.data()).pixel(1, 1), 9);
}

TEST(FrameView, ChannelCounts) {
    EXPECT_EQ(xicam_ng::channel_count(XI_MONO8), 1u);
    EXPECT_EQ(xicam_ng::channel_count(XI_MONO16), 1u);
    EXPECT_EQ(xicam_ng::channel_count(XI_RAW8), 1u);
    EXPECT_EQ(xicam_ng::channel_count(XI_RAW16), 1u);
    EXPECT_EQ(xicam_ng::channel_count(XI_RGB24), 3u);
    EXPECT_EQ(xicam_ng::channel_count(XI_RGB32), 4u);
    EXPECT_EQ(xicam_ng::channel_count(XI_RGB_PLANAR), 0u);
}

// tsSec/tsUSec combine into one 64-bit microsecond count without overflow.
TEST(FrameView, TimestampAndMetadata) {
    XI_IMG img = make_image(nullptr, XI_MONO8, 1, 1, 0, 0);
    img.tsSec = 4000000;
    img.tsUSec = 999999;
    img.nframe = 42;
    img.exposure_time_us = 1234;
    img.image_user_data = 7;
    auto view = view_over<uint8_t>(img);

    EXPECT_EQ(view.timestamp_us(), 4000000ULL * 1000000ULL + 999999ULL);
    EXPECT_EQ(view.nframe(), 42u);
    EXPECT_EQ(view.exposure_time_us(), 1234u);
    EXPECT_EQ(view.image_user_data(), 7u);
}
