#include "xicam_ng/FfmpegWriter.hpp"
#include "rclcpp/rclcpp.hpp"

namespace xicam_ng {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("FfmpegWriter"); }
}

AVPixelFormat av_format_for(XI_IMG_FORMAT format)
{
    switch (format) {
    case XI_MONO8:
    case XI_RAW8:   return AV_PIX_FMT_GRAY8;
    case XI_MONO16:
    case XI_RAW16:  return AV_PIX_FMT_GRAY16LE;
    case XI_RGB24:  return AV_PIX_FMT_BGR24;   // xiAPI stores B,G,R
    case XI_RGB32:  return AV_PIX_FMT_BGRA;
    default:        return AV_PIX_FMT_NONE;
    }
}

bool FfmpegWriter::open(const std::string& filename,
                        int width,
                        int height,
                        int fps,
                        AVPixelFormat src_format,
                        const std::string& codec_name)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (fmt_ctx_) {
        RCLCPP_WARN(logger(), "open(%s): writer already open", filename.c_str());
        return false;
    }
    if (src_format == AV_PIX_FMT_NONE || width <= 0 || height <= 0 || fps <= 0) {
        RCLCPP_ERROR(logger(), "open(%s): unsupported frame layout %dx%d@%d",
                     filename.c_str(), width, height, fps);
        return false;
    }
    width_ = width; height_ = height; fps_ = fps;
    frame_index_ = 0;

    avformat_alloc_output_context2(&fmt_ctx_, nullptr, nullptr, filename.c_str());
    if (!fmt_ctx_) {
        RCLCPP_ERROR(logger(), "could not allocate output context for %s", filename.c_str());
        return false;
    }

    const AVCodec* codec = avcodec_find_encoder_by_name(codec_name.c_str());
    if (!codec) {
        RCLCPP_ERROR(logger(), "codec not found: %s", codec_name.c_str());
        release();
        return false;
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        release();
        return false;
    }
    codec_ctx_->codec_id = codec->id;
    codec_ctx_->width = width_;
    codec_ctx_->height = height_;
    codec_ctx_->time_base = {1, fps_};
    codec_ctx_->framerate = {fps_, 1};
    codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codec_ctx_->bit_rate = 8'000'000;  // 8 Mbps

    if (fmt_ctx_->oformat->flags & AVFMT_GLOBALHEADER)
        codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        RCLCPP_ERROR(logger(), "could not open codec %s", codec_name.c_str());
        release();
        return false;
    }

    stream_ = avformat_new_stream(fmt_ctx_, nullptr);
    if (!stream_) {
        release();
        return false;
    }
    stream_->id = fmt_ctx_->nb_streams - 1;
    stream_->time_base = codec_ctx_->time_base;
    avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);

    if (!(fmt_ctx_->oformat->flags & AVFMT_NOFILE)) {
        if (avio_open(&fmt_ctx_->pb, filename.c_str(), AVIO_FLAG_WRITE) < 0) {
            RCLCPP_ERROR(logger(), "could not open output file %s", filename.c_str());
            release();
            return false;
        }
    }

    if (avformat_write_header(fmt_ctx_, nullptr) < 0) {
        RCLCPP_ERROR(logger(), "failed to write header for %s", filename.c_str());
        release();
        return false;
    }
    header_written_ = true;

    sws_ctx_ = sws_getContext(width_, height_, src_format,
                              width_, height_, AV_PIX_FMT_YUV420P,
                              SWS_BILINEAR, nullptr, nullptr, nullptr);

    frame_yuv_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!sws_ctx_ || !frame_yuv_ || !pkt_) {
        RCLCPP_ERROR(logger(), "could not allocate conversion buffers");
        release();
        return false;
    }
    frame_yuv_->format = AV_PIX_FMT_YUV420P;
    frame_yuv_->width = width_;
    frame_yuv_->height = height_;
    if (av_frame_get_buffer(frame_yuv_, 32) < 0) {
        release();
        return false;
    }

    RCLCPP_INFO(logger(), "writing %s: %dx%d @ %d fps, %s", filename.c_str(),
                width_, height_, fps_, codec_name.c_str());
    return true;
}

bool FfmpegWriter::write_frame(const uint8_t* data, int stride_bytes)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!fmt_ctx_ || !codec_ctx_ || !data) return false;

    if (av_frame_make_writable(frame_yuv_) < 0) return false;

    const uint8_t* src_slices[1] = { data };
    int src_stride[1] = { stride_bytes };
    sws_scale(sws_ctx_, src_slices, src_stride, 0, height_,
              frame_yuv_->data, frame_yuv_->linesize);

    frame_yuv_->pts = frame_index_++;

    if (avcodec_send_frame(codec_ctx_, frame_yuv_) < 0) return false;
    return drain();
}

bool FfmpegWriter::drain()
{
    while (avcodec_receive_packet(codec_ctx_, pkt_) == 0) {
        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        const int err = av_interleaved_write_frame(fmt_ctx_, pkt_);
        av_packet_unref(pkt_);
        if (err < 0) {
            RCLCPP_WARN(logger(), "av_interleaved_write_frame failed (%d)", err);
            return false;
        }
    }
    return true;
}

void FfmpegWriter::close()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!fmt_ctx_) return;

    if (header_written_ && codec_ctx_ && pkt_) {
        avcodec_send_frame(codec_ctx_, nullptr);
        drain();
        av_write_trailer(fmt_ctx_);
    }
    release();
}

// Frees everything; callers hold mtx_.
void FfmpegWriter::release()
{
    if (fmt_ctx_ && fmt_ctx_->pb && !(fmt_ctx_->oformat->flags & AVFMT_NOFILE))
        avio_closep(&fmt_ctx_->pb);

    av_frame_free(&frame_yuv_);
    av_packet_free(&pkt_);
    sws_freeContext(sws_ctx_);
    avcodec_free_context(&codec_ctx_);
    avformat_free_context(fmt_ctx_);

    fmt_ctx_ = nullptr;
    stream_ = nullptr;
    sws_ctx_ = nullptr;
    header_written_ = false;
}

bool FfmpegWriter::is_open() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return fmt_ctx_ != nullptr;
}

int64_t FfmpegWriter::frames_written() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return frame_index_;
}

} // namespace xicam_ng
