#include "xicam_ng/Recorder.hpp"
#include "rclcpp/rclcpp.hpp"
#include <cstring>

namespace xicam_ng {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("Recorder"); }
}

bool Recorder::start(const std::string& filename,
                     uint32_t width, uint32_t height, int fps,
                     XI_IMG_FORMAT format,
                     const std::string& codec_name,
                     size_t pool_size)
{
    if (running_) return false;

    const uint32_t channels = channel_count(format);
    if (channels == 0 || pool_size == 0) {
        RCLCPP_ERROR(logger(), "cannot record format %d with pool size %zu",
                     static_cast<int>(format), pool_size);
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    row_bytes_ = size_t(width) * channels * element_size(format);

    if (!writer_.open(filename, static_cast<int>(width), static_cast<int>(height), fps,
                      av_format_for(format), codec_name)) {
        RCLCPP_ERROR(logger(), "failed to open FFmpeg writer for %s", filename.c_str());
        return false;
    }

    pool_.allocate(row_bytes_ * height_, pool_size);
    dropped_ = 0;
    written_ = 0;

    running_ = true;
    worker_ = std::thread(&Recorder::loop, this);
    return true;
}

bool Recorder::push_bytes(const uint8_t* data, uint32_t width, uint32_t height,
                          size_t row_bytes, size_t stride_bytes, XI_IMG_FORMAT format)
{
    if (!running_) return false;
    if (!data || width != width_ || height != height_ || format != format_ ||
        row_bytes != row_bytes_) {
        RCLCPP_WARN_ONCE(logger(), "frame layout does not match the recording, skipping");
        dropped_++;
        return false;
    }

    uint8_t* buf = pool_.try_acquire();
    if (!buf) {
        dropped_++;
        return false;
    }

    for (uint32_t y = 0; y < height_; ++y)
        std::memcpy(buf + row_bytes_ * y, data + stride_bytes * y, row_bytes_);

    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        if (!running_) {
            pool_.release(buf);
            return false;
        }
        queue_.push(buf);
    }
    queue_cv_.notify_one();
    return true;
}

void Recorder::loop()
{
    for (;;) {
        uint8_t* buf = nullptr;
        {
            std::unique_lock<std::mutex> lock(queue_mtx_);
            queue_cv_.wait(lock, [&]{ return !queue_.empty() || !running_; });
            if (queue_.empty()) break;   // stopped and drained
            buf = queue_.front();
            queue_.pop();
        }

        if (writer_.write_frame(buf, static_cast<int>(row_bytes_)))
            written_++;
        else
            RCLCPP_WARN(logger(), "failed to encode frame");
        pool_.release(buf);
    }
}

void Recorder::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    if (writer_.is_open()) {
        writer_.close();
        RCLCPP_INFO(logger(), "recording closed: %llu written, %llu dropped",
                    static_cast<unsigned long long>(written_.load()),
                    static_cast<unsigned long long>(dropped_.load()));
    }
}

} // namespace xicam_ng
