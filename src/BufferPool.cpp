#include "xicam_ng/BufferPool.hpp"

namespace xicam_ng {

void BufferPool::allocate(size_t frame_bytes, size_t capacity)
{
    std::lock_guard<std::mutex> lock(mtx_);
    frame_bytes_ = frame_bytes;
    buffers_.assign(capacity, std::vector<uint8_t>(frame_bytes));
    std::queue<uint8_t*>().swap(free_);
    for (auto& b : buffers_) free_.push(b.data());
}

uint8_t* BufferPool::try_acquire()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (free_.empty()) return nullptr;
    uint8_t* p = free_.front();
    free_.pop();
    return p;
}

void BufferPool::release(uint8_t* buf)
{
    if (!buf) return;
    std::lock_guard<std::mutex> lock(mtx_);
    free_.push(buf);
}

size_t BufferPool::capacity() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return buffers_.size();
}

size_t BufferPool::frame_bytes() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return frame_bytes_;
}

size_t BufferPool::available() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return free_.size();
}

} // namespace xicam_ng
