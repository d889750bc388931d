#pragma once
#include "xicam_ng/ConfigurableSession.hpp"
#include "xicam_ng/FrameView.hpp"
#include "xicam_ng/Params.hpp"
#include "xicam_ng/Roi.hpp"
#include <m3api/xiApi.h>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace xicam_ng {

/**
 * @brief A camera that is acquiring images.
 *
 * Owns the ConfigurableSession it was started from. Only the parameters the
 * driver accepts during acquisition have setters here, and there
 * is no generic set(). stop() hands the device back as a ConfigurableSession.
 * Destroying a StreamingSession that was not stopped stops acquisition
 * (best-effort, failures are logged) and then closes the device.
 *
 * Frame views returned by next_image() borrow the session's buffer and go
 * stale at the next fetch, at stop() and at destruction.
 */
class StreamingSession {
public:
    StreamingSession(StreamingSession&& other) noexcept = default;
    StreamingSession& operator=(StreamingSession&& other) noexcept;
    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;
    ~StreamingSession();

    /**
     * Stops acquisition and returns the device as a ConfigurableSession.
     *
     * Throws XiError if xiStopAcquisition fails; the session then keeps
     * streaming and still owns the device.
     */
    ConfigurableSession stop() &&;

    /**
     * Blocks for the next frame, at most timeout_ms milliseconds.
     * Throws XiError (is_timeout() for XI_TIMEOUT) on failure.
     */
    template <typename T = uint8_t>
    FrameView<T> next_image(uint32_t timeout_ms = std::numeric_limits<uint32_t>::max())
    {
        fetch(timeout_ms);
        return FrameView<T>(image_, token_, token_->generation);
    }

    // Live-updatable parameters
    void set_exposure(float exposure_us);
    void set_exposure_burst_count(int count);
    void set_gain(float gain_db);
    void set_gain_selector(XI_GAIN_SELECTOR_TYPE selector);
    void set_image_user_data(uint32_t user_data);
    void set_led_selector(XI_LED_SELECTOR selector);
    void set_led_mode(XI_LED_MODE mode);
    void set_gpo_selector(int selector);
    void set_gpo_mode(XI_GPO_MODE mode);

    /// Fires one software trigger (trigger source must be XI_TRG_SOFTWARE).
    void software_trigger();

    template <typename T, Access A>
    T get(Param<T, A> p) const { return camera_.get(p); }

    template <typename T, Access A>
    T minimum(Param<T, A> p) const { return camera_.minimum(p); }

    template <typename T, Access A>
    T maximum(Param<T, A> p) const { return camera_.maximum(p); }

    template <typename T, Access A>
    T increment(Param<T, A> p) const { return camera_.increment(p); }

    Roi roi() const { return camera_.roi(); }

    /// Reads one counter and restores the previously selected counter.
    int counter(XI_COUNTER_SELECTOR counter) { return camera_.counter(counter); }

    HANDLE native_handle() const { return camera_.native_handle(); }

    explicit operator bool() const { return static_cast<bool>(camera_); }

private:
    friend class ConfigurableSession;

    StreamingSession(ConfigurableSession camera, std::vector<uint8_t> safe_buffer);

    void fetch(uint32_t timeout_ms);
    void shutdown();

    template <typename T>
    void set_live(Param<T> p, T value)
    {
        detail::write_param<T>(camera_.handle_.driver(), camera_.handle_.checked(), p.name, value);
    }

    ConfigurableSession camera_;
    XI_IMG image_;
    // Destination for frames under XI_BP_SAFE; empty under XI_BP_UNSAFE.
    std::vector<uint8_t> safe_buffer_;
    std::shared_ptr<detail::FrameToken> token_;
    bool active_ = false;
};

} // namespace xicam_ng
