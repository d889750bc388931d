#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "xicam_ng/FfmpegWriter.hpp"
#include "xicam_ng/FrameView.hpp"
#include "xicam_ng/Recorder.hpp"

using namespace xicam_ng;

namespace {

// Padded MONO8 frame: payload bytes are the row index, padding is 0xEE.
std::vector<uint8_t> padded_frame(uint32_t w, uint32_t h, uint32_t padding)
{
    std::vector<uint8_t> buf((w + padding) * h, 0xEE);
    for (uint32_t y = 0; y < h; ++y)
        std::memset(buf.data() + (w + padding) * y, static_cast<int>(y), w);
    return buf;
}

XI_IMG header_for(std::vector<uint8_t>& buf, uint32_t w, uint32_t h, uint32_t padding)
{
    XI_IMG img;
    std::memset(&img, 0, sizeof(img));
    img.size = sizeof(XI_IMG);
    img.bp = buf.data();
    img.bp_size = static_cast<DWORD>(buf.size());
    img.frm = XI_MONO8;
    img.width = w;
    img.height = h;
    img.padding_x = padding;
    return img;
}

long file_size(const std::string& path)
{
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    return f ? static_cast<long>(f.tellg()) : -1;
}

}  // namespace

TEST(Recorder, PixelFormatMapping) {
    EXPECT_EQ(av_format_for(XI_MONO8), AV_PIX_FMT_GRAY8);
    EXPECT_EQ(av_format_for(XI_RAW8), AV_PIX_FMT_GRAY8);
    EXPECT_EQ(av_format_for(XI_MONO16), AV_PIX_FMT_GRAY16LE);
    EXPECT_EQ(av_format_for(XI_RAW16), AV_PIX_FMT_GRAY16LE);
    EXPECT_EQ(av_format_for(XI_RGB24), AV_PIX_FMT_BGR24);
    EXPECT_EQ(av_format_for(XI_RGB32), AV_PIX_FMT_BGRA);
    EXPECT_EQ(av_format_for(XI_RGB_PLANAR), AV_PIX_FMT_NONE);
}

// Unsupported layouts are refused at open time.
TEST(FfmpegWriter, RejectsUnsupportedFormat) {
    FfmpegWriter writer;
    const std::string path = ::testing::TempDir() + "xicam_ng_reject.avi";
    EXPECT_FALSE(writer.open(path, 64, 48, 25, AV_PIX_FMT_NONE, "mpeg4"));
    EXPECT_FALSE(writer.is_open());
    EXPECT_FALSE(writer.open(path, 64, 48, 25, AV_PIX_FMT_GRAY8, "no-such-codec"));
    EXPECT_FALSE(writer.is_open());
}

// Padded frames are packed and encoded; every queued frame reaches the writer.
TEST(Recorder, EncodesPaddedFrames) {
    const uint32_t w = 64, h = 48, padding = 8;
    const std::string path = ::testing::TempDir() + "xicam_ng_recorder.avi";
    std::remove(path.c_str());

    auto buf = padded_frame(w, h, padding);
    auto view = FrameView<uint8_t>::over(header_for(buf, w, h, padding), buf.data());

    Recorder rec;
    ASSERT_TRUE(rec.start(path, w, h, 25, XI_MONO8, "mpeg4", 4));
    EXPECT_TRUE(rec.running());

    int queued = 0;
    for (int i = 0; i < 20; ++i) {
        if (rec.push(view)) queued++;
        else std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    rec.stop();

    EXPECT_FALSE(rec.running());
    EXPECT_EQ(rec.written(), static_cast<uint64_t>(queued));
    EXPECT_EQ(rec.written() + rec.dropped(), 20u);
    EXPECT_GT(file_size(path), 0);
    std::remove(path.c_str());
}

// Frames whose geometry differs from the recording are dropped, not encoded.
TEST(Recorder, DropsMismatchedFrames) {
    const std::string path = ::testing::TempDir() + "xicam_ng_mismatch.avi";
    Recorder rec;
    ASSERT_TRUE(rec.start(path, 64, 48, 25, XI_MONO8, "mpeg4", 2));

    auto buf = padded_frame(32, 48, 0);
    auto narrow = FrameView<uint8_t>::over(header_for(buf, 32, 48, 0), buf.data());
    EXPECT_FALSE(rec.push(narrow));

    // 16-bit view over an 8-bit recording has the wrong row size.
    auto buf16 = padded_frame(64 * 2, 48, 0);
    XI_IMG img16 = header_for(buf16, 64, 48, 0);
    img16.frm = XI_MONO16;
    EXPECT_FALSE(rec.push(FrameView<uint16_t>::over(img16, buf16.data())));

    rec.stop();
    EXPECT_EQ(rec.dropped(), 2u);
    EXPECT_EQ(rec.written(), 0u);
    std::remove(path.c_str());
}

// push() before start() is a no-op.
TEST(Recorder, PushWithoutStart) {
    Recorder rec;
    auto buf = padded_frame(8, 8, 0);
    EXPECT_FALSE(rec.push(FrameView<uint8_t>::over(header_for(buf, 8, 8, 0), buf.data())));
    EXPECT_EQ(rec.dropped(), 0u);
}
