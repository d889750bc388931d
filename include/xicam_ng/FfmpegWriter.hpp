#pragma once
#include <m3api/xiApi.h>
#include <string>
#include <cstdint>
#include <mutex>
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

namespace xicam_ng {

/// FFmpeg pixel format matching an xiAPI image format, AV_PIX_FMT_NONE when there is none.
AVPixelFormat av_format_for(XI_IMG_FORMAT format);

/**
 * @brief Encodes tightly packed camera frames to a video file.
 *
 * Source frames in `src_format` are converted to YUV420P with swscale.
 *
 * Usage:
 *   FfmpegWriter writer;
 *   writer.open("out.mp4", 1280, 1024, 60, AV_PIX_FMT_GRAY8, "libx264");
 *   writer.write_frame(data, stride_bytes);
 *   writer.close();
 */
class FfmpegWriter {
public:
    FfmpegWriter() = default;
    ~FfmpegWriter() { close(); }

    FfmpegWriter(const FfmpegWriter&) = delete;
    FfmpegWriter& operator=(const FfmpegWriter&) = delete;

    bool open(const std::string& filename,
              int width,
              int height,
              int fps,
              AVPixelFormat src_format,
              const std::string& codec_name = "libx264");

    bool write_frame(const uint8_t* data, int stride_bytes);
    void close();

    bool is_open() const;
    int64_t frames_written() const;

private:
    bool drain();
    void release();

    mutable std::mutex mtx_;
    AVFormatContext* fmt_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    AVFrame* frame_yuv_ = nullptr;
    AVPacket* pkt_ = nullptr;
    bool header_written_ = false;
    int width_ = 0, height_ = 0, fps_ = 0;
    int64_t frame_index_ = 0;
};

} // namespace xicam_ng
