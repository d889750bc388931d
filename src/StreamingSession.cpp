#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <cstring>
#include <iostream>
#include <utility>

namespace xicam_ng {

// Every setter below must belong to a key the table marks live.
static_assert(prm::exposure.live, "exposure is not live-updatable");
static_assert(prm::exposure_burst_count.live, "exposure_burst_count is not live-updatable");
static_assert(prm::gain.live, "gain is not live-updatable");
static_assert(prm::gain_selector.live, "gain_selector is not live-updatable");
static_assert(prm::image_user_data.live, "image_user_data is not live-updatable");
static_assert(prm::led_selector.live, "led_selector is not live-updatable");
static_assert(prm::led_mode.live, "led_mode is not live-updatable");
static_assert(prm::gpo_selector.live, "gpo_selector is not live-updatable");
static_assert(prm::gpo_mode.live, "gpo_mode is not live-updatable");
static_assert(prm::trg_software.live, "trg_software is not live-updatable");

StreamingSession::StreamingSession(ConfigurableSession camera, std::vector<uint8_t> safe_buffer)
    : camera_(std::move(camera)),
      image_{},
      safe_buffer_(std::move(safe_buffer)),
      token_(std::make_shared<detail::FrameToken>()),
      active_(true)
{}

StreamingSession& StreamingSession::operator=(StreamingSession&& other) noexcept
{
    if (this != &other) {
        shutdown();
        camera_ = std::move(other.camera_);
        image_ = other.image_;
        safe_buffer_ = std::move(other.safe_buffer_);
        token_ = std::move(other.token_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

StreamingSession::~StreamingSession()
{
    shutdown();
}

void StreamingSession::shutdown()
{
    if (active_ && camera_) {
        XI_RETURN stat = camera_.handle_.driver().stop_acquisition(camera_.handle_.get());
        if (stat != XI_OK)
            std::cerr << "[StreamingSession] xiStopAcquisition failed while closing: "
                      << xi_error_name(stat) << " (" << stat << ")\n";
    }
    active_ = false;
    token_.reset();
}

ConfigurableSession StreamingSession::stop() &&
{
    HANDLE h = camera_.handle_.checked();
    check(camera_.handle_.driver().stop_acquisition(h), "xiStopAcquisition");
    active_ = false;
    token_.reset();
    return std::move(camera_);
}

void StreamingSession::fetch(uint32_t timeout_ms)
{
    HANDLE h = camera_.handle_.checked();
    IDriver& driver = camera_.handle_.driver();

    // Views of the previous frame go stale even if this fetch fails: the
    // driver may already have reused the buffer.
    ++token_->generation;

    std::memset(&image_, 0, sizeof(image_));
    image_.size = sizeof(XI_IMG);
    if (!safe_buffer_.empty()) {
        image_.bp = safe_buffer_.data();
        image_.bp_size = static_cast<DWORD>(safe_buffer_.size());
    }
    check(driver.get_image(h, timeout_ms, &image_), "xiGetImage");
}

void StreamingSession::set_exposure(float exposure_us)
{
    set_live(prm::exposure, exposure_us);
}

void StreamingSession::set_exposure_burst_count(int count)
{
    set_live(prm::exposure_burst_count, count);
}

void StreamingSession::set_gain(float gain_db)
{
    set_live(prm::gain, gain_db);
}

void StreamingSession::set_gain_selector(XI_GAIN_SELECTOR_TYPE selector)
{
    set_live(prm::gain_selector, selector);
}

void StreamingSession::set_image_user_data(uint32_t user_data)
{
    set_live(prm::image_user_data, static_cast<int>(user_data));
}

void StreamingSession::set_led_selector(XI_LED_SELECTOR selector)
{
    set_live(prm::led_selector, selector);
}

void StreamingSession::set_led_mode(XI_LED_MODE mode)
{
    set_live(prm::led_mode, mode);
}

void StreamingSession::set_gpo_selector(int selector)
{
    set_live(prm::gpo_selector, selector);
}

void StreamingSession::set_gpo_mode(XI_GPO_MODE mode)
{
    set_live(prm::gpo_mode, mode);
}

void StreamingSession::software_trigger()
{
    set_live(prm::trg_software, 1);
}

} // namespace xicam_ng
