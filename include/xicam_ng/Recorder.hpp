#pragma once
#include "xicam_ng/BufferPool.hpp"
#include "xicam_ng/FfmpegWriter.hpp"
#include "xicam_ng/FrameView.hpp"
#include <m3api/xiApi.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace xicam_ng {

/**
 * @brief Copies frames out of borrowed views and encodes them on a writer thread.
 *
 * push() runs on the grab thread: it strips row padding into a pooled buffer
 * and queues it. When every pool buffer is waiting for the encoder the frame
 * is dropped and counted instead of blocking the camera. stop() lets the
 * writer drain the queue before the file is closed.
 */
class Recorder {
public:
    Recorder() = default;
    ~Recorder() { stop(); }

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    bool start(const std::string& filename,
               uint32_t width, uint32_t height, int fps,
               XI_IMG_FORMAT format,
               const std::string& codec_name = "libx264",
               size_t pool_size = 8);

    /// Queues a copy of the frame. Returns false if it was dropped or rejected.
    template <typename T>
    bool push(const FrameView<T>& view)
    {
        return push_bytes(view.bytes(), view.width(), view.height(),
                          view.row_bytes(), view.stride_bytes(), view.format());
    }

    void stop();

    bool running() const { return running_; }
    uint64_t dropped() const { return dropped_; }
    uint64_t written() const { return written_; }

private:
    bool push_bytes(const uint8_t* data, uint32_t width, uint32_t height,
                    size_t row_bytes, size_t stride_bytes, XI_IMG_FORMAT format);
    void loop();

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> written_{0};

    std::mutex queue_mtx_;
    std::condition_variable queue_cv_;
    std::queue<uint8_t*> queue_;

    BufferPool pool_;
    FfmpegWriter writer_;
    uint32_t width_ = 0, height_ = 0;
    size_t row_bytes_ = 0;
    XI_IMG_FORMAT format_ = XI_MONO8;
};

} // namespace xicam_ng
