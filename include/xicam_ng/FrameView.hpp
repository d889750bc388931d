#pragma once
#include <m3api/xiApi.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace xicam_ng {

/// Number of interleaved channels per pixel for an xiAPI image format, 0 when unsupported.
uint32_t channel_count(XI_IMG_FORMAT format);

/// Bytes per channel element for an xiAPI image format, 0 when unsupported.
uint32_t element_size(XI_IMG_FORMAT format);

/// Read-only contiguous run of pixel elements.
template <typename T>
class PixelSpan {
public:
    PixelSpan() = default;
    PixelSpan(const T* data, size_t size) : data_(data), size_(size) {}

    const T* begin() const { return data_; }
    const T* end() const { return data_ + size_; }
    const T* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    const T& operator[](size_t i) const { return data_[i]; }

    /// Element i, or nullptr past the end.
    const T* at(size_t i) const { return i < size_ ? data_ + i : nullptr; }

private:
    const T* data_ = nullptr;
    size_t size_ = 0;
};

namespace detail {
// Shared between a StreamingSession and the views it hands out. The session
// bumps generation on every fetch and drops the token when it stops.
struct FrameToken {
    uint64_t generation = 0;
};
} // namespace detail

class StreamingSession;

/**
 * @brief Borrowed, bounds-checked view of one frame buffer.
 *
 * The view copies the XI_IMG header at fetch time and borrows the pixel
 * memory. Views handed out by StreamingSession stop resolving pixels once the
 * session fetches the next frame, stops, or is destroyed: pixel() then returns
 * nullptr and data() an empty span. The header accessors stay readable.
 *
 * `T` is the channel element type (uint8_t for 8-bit and RGB formats,
 * uint16_t for 16-bit formats).
 */
template <typename T>
class FrameView {
public:
    FrameView() : image_{} {}

    /**
     * Unbound view of `buffer` laid out as described by `header`. The caller
     * owns the memory and keeps it alive for as long as the view is used.
     */
    static FrameView over(const XI_IMG& header, const void* buffer)
    {
        XI_IMG image = header;
        image.bp = const_cast<void*>(buffer);
        return FrameView(image);
    }

    bool valid() const { return buffer() != nullptr; }

    /**
     * Element at column x, row y, or nullptr when the buffer is null or stale,
     * x/y are outside the image, or T does not match the format's element
     * size. The address never runs past bp_size when the driver reported one.
     */
    const T* pixel(size_t x, size_t y) const
    {
        const uint8_t* base = buffer();
        if (!base || !layout_matches()) return nullptr;
        if (x >= image_.width || y >= image_.height) return nullptr;
        const size_t pixel_bytes = sizeof(T) * channels_;
        const size_t stride = image_.width * pixel_bytes + image_.padding_x;
        const size_t offset = stride * y + x * pixel_bytes;
        if (image_.bp_size != 0 && offset + pixel_bytes > image_.bp_size) return nullptr;
        return reinterpret_cast<const T*>(base + offset);
    }

    /// Whole buffer as a linear run of elements (row padding included).
    PixelSpan<T> data() const
    {
        const uint8_t* base = buffer();
        if (!base || !layout_matches()) return {};
        const size_t len = image_.bp_size != 0
            ? image_.bp_size / sizeof(T)
            : size_t(image_.width) * image_.height * channels_;
        return PixelSpan<T>(reinterpret_cast<const T*>(base), len);
    }

    /// Raw bytes of the buffer, nullptr when stale.
    const uint8_t* bytes() const { return buffer(); }

    uint32_t width() const { return image_.width; }
    uint32_t height() const { return image_.height; }
    uint32_t padding_x() const { return image_.padding_x; }
    uint32_t channels() const { return channels_; }
    uint32_t byte_size() const { return image_.bp_size; }
    size_t row_bytes() const { return size_t(image_.width) * sizeof(T) * channels_; }
    size_t stride_bytes() const { return row_bytes() + image_.padding_x; }

    XI_IMG_FORMAT format() const { return image_.frm; }
    uint32_t nframe() const { return image_.nframe; }
    uint32_t acq_nframe() const { return image_.acq_nframe; }
    uint32_t exposure_time_us() const { return image_.exposure_time_us; }
    float gain_db() const { return image_.gain_db; }
    uint32_t black_level() const { return image_.black_level; }
    uint32_t absolute_offset_x() const { return image_.AbsoluteOffsetX; }
    uint32_t absolute_offset_y() const { return image_.AbsoluteOffsetY; }
    uint32_t image_user_data() const { return image_.image_user_data; }

    /// Frame timestamp in microseconds, assembled from tsSec and tsUSec.
    uint64_t timestamp_us() const
    {
        return static_cast<uint64_t>(image_.tsSec) * 1'000'000ULL +
               static_cast<uint64_t>(image_.tsUSec);
    }

    /// Copy of the frame header without the buffer pointer.
    XI_IMG header() const
    {
        XI_IMG image = image_;
        image.bp = nullptr;
        return image;
    }

private:
    friend class StreamingSession;

    explicit FrameView(const XI_IMG& image)
        : image_(image), channels_(channel_count(image.frm)) {}

    FrameView(const XI_IMG& image, std::weak_ptr<const detail::FrameToken> token,
              uint64_t generation)
        : image_(image), channels_(channel_count(image.frm)),
          token_(std::move(token)), generation_(generation), bound_(true) {}

    // Known format whose element size is sizeof(T).
    bool layout_matches() const
    {
        return channels_ != 0 && element_size(image_.frm) == sizeof(T);
    }

    const uint8_t* buffer() const
    {
        if (!image_.bp) return nullptr;
        if (bound_) {
            auto token = token_.lock();
            if (!token || token->generation != generation_) return nullptr;
        }
        return static_cast<const uint8_t*>(image_.bp);
    }

    XI_IMG image_;
    uint32_t channels_ = 0;
    std::weak_ptr<const detail::FrameToken> token_;
    uint64_t generation_ = 0;
    bool bound_ = false;
};

} // namespace xicam_ng
