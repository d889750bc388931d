#pragma once
#include <vector>
#include <queue>
#include <mutex>
#include <cstdint>

namespace xicam_ng {

/**
 * @brief Thread-safe pool of fixed-size frame buffers.
 *
 * Allocates N blocks of `frame_bytes` bytes each up front. The grab thread
 * takes buffers with try_acquire() so it never waits on the encoder; the
 * writer thread hands them back with release().
 */
class BufferPool {
public:
    BufferPool() = default;
    BufferPool(size_t frame_bytes, size_t capacity) { allocate(frame_bytes, capacity); }

    /// (Re)allocates the pool. Buffers handed out earlier become invalid.
    void allocate(size_t frame_bytes, size_t capacity);

    /// Free buffer, or nullptr right away when the pool is exhausted.
    uint8_t* try_acquire();

    /// Return a previously acquired buffer to the pool.
    void release(uint8_t* buf);

    size_t capacity() const;
    size_t frame_bytes() const;
    size_t available() const;

private:
    size_t frame_bytes_ = 0;
    std::vector<std::vector<uint8_t>> buffers_;
    std::queue<uint8_t*> free_;
    mutable std::mutex mtx_;
};

} // namespace xicam_ng
