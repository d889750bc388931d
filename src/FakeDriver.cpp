#include "xicam_ng/FakeDriver.hpp"
#include "xicam_ng/FrameView.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>

using namespace std::chrono;

namespace xicam_ng {

struct FakeDriver::Device {
    uint32_t index = 0;
    bool acquiring = false;
    std::map<std::string, Setting> params;
    std::vector<uint8_t> frame;
    uint32_t nframe = 0;
    uint32_t acq_nframe = 0;
    uint32_t pending_triggers = 0;
    std::map<int, int> counters;
    steady_clock::time_point next_frame;
};

namespace {

// Splits "width:inc" into "width" and ":inc".
void split_modifier(const std::string& name, std::string& base, std::string& modifier)
{
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        base = name;
        modifier.clear();
    } else {
        base = name.substr(0, pos);
        modifier = name.substr(pos);
    }
}

} // namespace

FakeDriver::FakeDriver() : FakeDriver(Options{}) {}

FakeDriver::FakeDriver(Options options) : opts_(std::move(options))
{
    globals_[XI_PRM_AUTO_BANDWIDTH_CALCULATION] = XI_ON;
    globals_[XI_PRM_DEBUG_LEVEL] = XI_DL_WARNING;
}

FakeDriver::~FakeDriver() = default;

// ---------------- helpers ----------------
FakeDriver::Device* FakeDriver::find(HANDLE handle) const
{
    for (const auto& d : devices_)
        if (static_cast<HANDLE>(d.get()) == handle) return d.get();
    return nullptr;
}

bool FakeDriver::take_failure(const std::string& call, XI_RETURN& code)
{
    auto it = failures_.find(call);
    if (it == failures_.end()) return false;
    code = it->second;
    failures_.erase(it);
    return true;
}

void FakeDriver::refresh_limits(Device& dev)
{
    auto& p = dev.params;
    p[XI_PRM_WIDTH].max    = opts_.sensor_width  - p[XI_PRM_OFFSET_X].value;
    p[XI_PRM_HEIGHT].max   = opts_.sensor_height - p[XI_PRM_OFFSET_Y].value;
    p[XI_PRM_OFFSET_X].max = opts_.sensor_width  - p[XI_PRM_WIDTH].value;
    p[XI_PRM_OFFSET_Y].max = opts_.sensor_height - p[XI_PRM_HEIGHT].value;
}

XI_RETURN FakeDriver::read(HANDLE handle, const std::string& name, double& value)
{
    std::string base, modifier;
    split_modifier(name, base, modifier);

    if (!handle) {
        auto it = globals_.find(base);
        if (it == globals_.end() || !modifier.empty()) return XI_NOT_SUPPORTED_PARAM;
        value = it->second;
        return XI_OK;
    }

    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;
    auto& p = dev->params;

    if (base == XI_PRM_IMAGE_PAYLOAD_SIZE && modifier.empty()) {
        const auto fmt = static_cast<XI_IMG_FORMAT>(std::lround(p[XI_PRM_IMAGE_DATA_FORMAT].value));
        const double row = p[XI_PRM_WIDTH].value * element_size(fmt) * channel_count(fmt) + opts_.padding_x;
        value = row * p[XI_PRM_HEIGHT].value;
        return XI_OK;
    }
    if (base == XI_PRM_COUNTER_VALUE && modifier.empty()) {
        const int selector = static_cast<int>(std::lround(p[XI_PRM_COUNTER_SELECTOR].value));
        value = dev->counters[selector];
        return XI_OK;
    }

    auto it = p.find(base);
    if (it == p.end()) return XI_NOT_SUPPORTED_PARAM;
    const Setting& s = it->second;
    if (modifier.empty())                     value = s.value;
    else if (modifier == XI_PRM_INFO_MIN)       value = s.min;
    else if (modifier == XI_PRM_INFO_MAX)       value = s.max;
    else if (modifier == XI_PRM_INFO_INCREMENT) value = s.inc;
    else return XI_NOT_SUPPORTED_PARAM;
    return XI_OK;
}

XI_RETURN FakeDriver::write(HANDLE handle, const std::string& name, double value)
{
    if (name.find(':') != std::string::npos) return XI_READ_ONLY_PARAM;

    if (!handle) {
        globals_[name] = value;
        writes_[name]++;
        return XI_OK;
    }

    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;

    auto it = dev->params.find(name);
    if (it == dev->params.end()) return XI_NOT_SUPPORTED_PARAM;
    Setting& s = it->second;

    if (s.read_only) return XI_READ_ONLY_PARAM;
    if (dev->acquiring && !s.live) return XI_NOT_SUPPORTED;

    if (s.quantize) {
        value = std::round(value / s.inc) * s.inc;
        value = std::min(std::max(value, s.min), s.max);
    } else {
        if (value < s.min || value > s.max) return XI_WRONG_PARAM_VALUE;
        if (!s.is_float && s.inc > 1 &&
            std::fmod(value - s.min, s.inc) != 0.0) return XI_WRONG_PARAM_VALUE;
    }

    if (name == XI_PRM_IMAGE_DATA_FORMAT &&
        channel_count(static_cast<XI_IMG_FORMAT>(std::lround(value))) == 0)
        return XI_WRONG_PARAM_VALUE;

    writes_[name]++;

    if (name == XI_PRM_TRG_SOFTWARE) {
        if (std::lround(dev->params[XI_PRM_TRG_SOURCE].value) == XI_TRG_SOFTWARE) {
            dev->pending_triggers++;
            cv_.notify_all();
        }
        return XI_OK;
    }

    s.value = value;
    refresh_limits(*dev);
    return XI_OK;
}

void FakeDriver::render(Device& dev)
{
    auto& p = dev.params;
    const auto fmt = static_cast<XI_IMG_FORMAT>(std::lround(p[XI_PRM_IMAGE_DATA_FORMAT].value));
    const uint32_t w  = static_cast<uint32_t>(p[XI_PRM_WIDTH].value);
    const uint32_t h  = static_cast<uint32_t>(p[XI_PRM_HEIGHT].value);
    const uint32_t ch = channel_count(fmt);
    const uint32_t es = element_size(fmt);
    const size_t stride = size_t(w) * ch * es + opts_.padding_x;

    // Padding bytes keep a recognizable filler value.
    dev.frame.assign(stride * h, 0xEE);

    // Simple moving gradient pattern
    for (uint32_t y = 0; y < h; ++y) {
        uint8_t* row = dev.frame.data() + stride * y;
        for (uint32_t x = 0; x < w; ++x) {
            for (uint32_t c = 0; c < ch; ++c) {
                const uint32_t v = (x + y + c + dev.nframe) % 256;
                if (es == 1) {
                    row[x * ch + c] = static_cast<uint8_t>(v);
                } else {
                    const uint16_t v16 = static_cast<uint16_t>(v << 4);
                    std::memcpy(row + (size_t(x) * ch + c) * 2, &v16, sizeof(v16));
                }
            }
        }
    }
}

// --------------- enumerate/open/close ---------------
XI_RETURN FakeDriver::get_number_devices(uint32_t* count)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiGetNumberDevices", err)) return err;
    *count = opts_.devices;
    return XI_OK;
}

XI_RETURN FakeDriver::open_device(uint32_t device_index, HANDLE* handle)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiOpenDevice", err)) return err;
    if (device_index >= opts_.devices) return XI_INVALID_ARG;

    auto num = [](double v, double mn, double mx, double inc = 1, bool live = false) {
        Setting s;
        s.value = v; s.min = mn; s.max = mx; s.inc = inc; s.live = live;
        return s;
    };
    auto real = [&](double v, double mn, double mx, double inc, bool live) {
        Setting s = num(v, mn, mx, inc, live);
        s.is_float = true;
        s.quantize = true;
        return s;
    };
    auto ro = [&](double v) {
        Setting s = num(v, v, v);
        s.read_only = true;
        return s;
    };
    const double int_max = std::numeric_limits<int>::max();
    const double sw = opts_.sensor_width, sh = opts_.sensor_height;

    auto dev = std::make_unique<Device>();
    dev->index = device_index;
    auto& p = dev->params;
    p[XI_PRM_EXPOSURE]              = real(10000, 10, 1'000'000, opts_.exposure_step_us, true);
    p[XI_PRM_EXPOSURE_BURST_COUNT]  = num(1, 1, 32, 1, true);
    p[XI_PRM_GAIN]                  = real(0, 0, 24, opts_.gain_step_db, true);
    p[XI_PRM_GAIN_SELECTOR]         = num(XI_GAIN_SELECTOR_ALL, 0, 8, 1, true);
    p[XI_PRM_IMAGE_DATA_FORMAT]     = num(XI_MONO8, 0, 16);
    p[XI_PRM_WIDTH]                 = num(sw, opts_.width_increment, sw, opts_.width_increment);
    p[XI_PRM_HEIGHT]                = num(sh, opts_.height_increment, sh, opts_.height_increment);
    p[XI_PRM_OFFSET_X]              = num(0, 0, 0, opts_.offset_x_increment);
    p[XI_PRM_OFFSET_Y]              = num(0, 0, 0, opts_.offset_y_increment);
    p[XI_PRM_DOWNSAMPLING]          = num(XI_DWN_1x1, XI_DWN_1x1, XI_DWN_1x1);
    p[XI_PRM_DOWNSAMPLING_TYPE]     = num(XI_BINNING, XI_BINNING, XI_BINNING);
    p[XI_PRM_FRAMERATE]             = real(60, 1, 500, 0.01, false);
    p[XI_PRM_ACQ_TIMING_MODE]       = num(XI_ACQ_TIMING_MODE_FREE_RUN, 0, 4);
    p[XI_PRM_TRG_SOURCE]            = num(XI_TRG_OFF, 0, 8);
    p[XI_PRM_TRG_SELECTOR]          = num(XI_TRG_SEL_FRAME_START, 0, 16);
    p[XI_PRM_TRG_SOFTWARE]          = num(0, 1, 1, 1, true);
    p[XI_PRM_GPI_SELECTOR]          = num(1, 0, 16);
    p[XI_PRM_GPI_MODE]              = num(XI_GPI_OFF, 0, 16);
    p[XI_PRM_GPI_LEVEL]             = ro(0);
    p[XI_PRM_GPO_SELECTOR]          = num(1, 0, 16, 1, true);
    p[XI_PRM_GPO_MODE]              = num(XI_GPO_OFF, 0, 32, 1, true);
    p[XI_PRM_LED_SELECTOR]          = num(1, 0, 16, 1, true);
    p[XI_PRM_LED_MODE]              = num(0, 0, 32, 1, true);
    p[XI_PRM_TEST_PATTERN]          = num(XI_TESTPAT_OFF, 0, 32);
    p[XI_PRM_ACQ_BUFFER_SIZE]       = num(50 * 1024 * 1024, 1024 * 1024, int_max);
    p[XI_PRM_BUFFERS_QUEUE_SIZE]    = num(4, 2, 64);
    p[XI_PRM_BUFFER_POLICY]         = num(XI_BP_UNSAFE, 0, 1);
    p[XI_PRM_IMAGE_USER_DATA]       = num(0, 0, int_max, 1, true);
    p[XI_PRM_AVAILABLE_BANDWIDTH]   = ro(2400);
    p[XI_PRM_LIMIT_BANDWIDTH]       = num(2400, 100, 2400);
    p[XI_PRM_LIMIT_BANDWIDTH_MODE]  = num(XI_OFF, 0, 1);
    p[XI_PRM_SENSOR_FEATURE_SELECTOR] = num(0, 0, 16);
    p[XI_PRM_SENSOR_FEATURE_VALUE]  = num(0, 0, 1);
    p[XI_PRM_COUNTER_SELECTOR]      = num(XI_CNT_SEL_TRANSPORT_SKIPPED_FRAMES, 0, 16, 1, true);
    refresh_limits(*dev);

    *handle = static_cast<HANDLE>(dev.get());
    devices_.push_back(std::move(dev));
    return XI_OK;
}

XI_RETURN FakeDriver::close_device(HANDLE handle)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiCloseDevice", err)) return err;
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const std::unique_ptr<Device>& d) { return d.get() == handle; });
    if (it == devices_.end()) return XI_INVALID_HANDLE;
    devices_.erase(it);
    close_calls_++;
    cv_.notify_all();
    return XI_OK;
}

// --------------- acquisition ---------------
XI_RETURN FakeDriver::start_acquisition(HANDLE handle)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiStartAcquisition", err)) return err;
    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;
    if (dev->acquiring) return XI_INVALID_ARG;
    dev->acquiring = true;
    dev->acq_nframe = 0;
    dev->pending_triggers = 0;
    dev->next_frame = steady_clock::now();
    return XI_OK;
}

XI_RETURN FakeDriver::stop_acquisition(HANDLE handle)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiStopAcquisition", err)) return err;
    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;
    if (!dev->acquiring) return XI_ACQUISITION_STOPED;
    dev->acquiring = false;
    dev->pending_triggers = 0;
    cv_.notify_all();
    return XI_OK;
}

XI_RETURN FakeDriver::get_image(HANDLE handle, uint32_t timeout_ms, XI_IMG* image)
{
    std::unique_lock<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiGetImage", err)) return err;
    if (!image || image->size != sizeof(XI_IMG)) return XI_INVALID_ARG;

    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;
    if (!dev->acquiring) return XI_ACQUISITION_STOPED;

    if (std::lround(dev->params[XI_PRM_TRG_SOURCE].value) != XI_TRG_OFF) {
        // Only software triggers ever fire here; hardware sources time out.
        cv_.wait_for(lock, milliseconds(timeout_ms), [&] {
            Device* d = find(handle);
            return !d || !d->acquiring || d->pending_triggers > 0;
        });
        dev = find(handle);
        if (!dev) return XI_INVALID_HANDLE;
        if (!dev->acquiring) return XI_ACQUISITION_STOPED;
        if (dev->pending_triggers == 0) return XI_TIMEOUT;
        dev->pending_triggers--;
    } else {
        // Free run: pace frames at the configured frame rate.
        const auto period = duration_cast<steady_clock::duration>(
            duration<double>(1.0 / dev->params[XI_PRM_FRAMERATE].value));
        const auto deadline = steady_clock::now() + milliseconds(timeout_ms);
        if (dev->next_frame > deadline) {
            cv_.wait_until(lock, deadline);
            return XI_TIMEOUT;
        }
        const auto due = dev->next_frame;
        cv_.wait_until(lock, due, [&] {
            Device* d = find(handle);
            return !d || !d->acquiring;
        });
        dev = find(handle);
        if (!dev) return XI_INVALID_HANDLE;
        if (!dev->acquiring) return XI_ACQUISITION_STOPED;
        dev->next_frame = std::max(due, steady_clock::now()) + period;
    }

    dev->nframe++;
    dev->acq_nframe++;
    render(*dev);
    auto& p = dev->params;
    const uint32_t payload = static_cast<uint32_t>(dev->frame.size());

    if (std::lround(p[XI_PRM_BUFFER_POLICY].value) == XI_BP_SAFE) {
        if (!image->bp || image->bp_size < payload) return XI_BUFFER_TOO_SMALL;
        std::memcpy(image->bp, dev->frame.data(), payload);
    } else {
        image->bp = dev->frame.data();
    }

    const auto now = duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
    image->bp_size = payload;
    image->frm = static_cast<XI_IMG_FORMAT>(std::lround(p[XI_PRM_IMAGE_DATA_FORMAT].value));
    image->width = static_cast<uint32_t>(p[XI_PRM_WIDTH].value);
    image->height = static_cast<uint32_t>(p[XI_PRM_HEIGHT].value);
    image->padding_x = opts_.padding_x;
    image->nframe = dev->nframe;
    image->acq_nframe = dev->acq_nframe;
    image->tsSec = static_cast<uint32_t>(now / 1'000'000);
    image->tsUSec = static_cast<uint32_t>(now % 1'000'000);
    image->black_level = 0;
    image->AbsoluteOffsetX = static_cast<uint32_t>(p[XI_PRM_OFFSET_X].value);
    image->AbsoluteOffsetY = static_cast<uint32_t>(p[XI_PRM_OFFSET_Y].value);
    image->exposure_time_us = static_cast<uint32_t>(std::lround(p[XI_PRM_EXPOSURE].value));
    image->gain_db = static_cast<float>(p[XI_PRM_GAIN].value);
    image->image_user_data = static_cast<uint32_t>(p[XI_PRM_IMAGE_USER_DATA].value);

    dev->counters[XI_CNT_SEL_TRANSPORT_TRANSFERRED_FRAMES]++;
    return XI_OK;
}

// --------------- parameters ---------------
XI_RETURN FakeDriver::get_param_int(HANDLE handle, const char* name, int* value)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiGetParam", err) || take_failure(std::string("xiGetParam:") + name, err))
        return err;
    double v = 0;
    err = read(handle, name, v);
    if (err == XI_OK) *value = static_cast<int>(std::lround(v));
    return err;
}

XI_RETURN FakeDriver::set_param_int(HANDLE handle, const char* name, int value)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiSetParam", err) || take_failure(std::string("xiSetParam:") + name, err))
        return err;
    return write(handle, name, value);
}

XI_RETURN FakeDriver::get_param_float(HANDLE handle, const char* name, float* value)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiGetParam", err) || take_failure(std::string("xiGetParam:") + name, err))
        return err;
    double v = 0;
    err = read(handle, name, v);
    if (err == XI_OK) *value = static_cast<float>(v);
    return err;
}

XI_RETURN FakeDriver::set_param_float(HANDLE handle, const char* name, float value)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiSetParam", err) || take_failure(std::string("xiSetParam:") + name, err))
        return err;
    return write(handle, name, value);
}

XI_RETURN FakeDriver::get_param_string(HANDLE handle, const char* name, char* value, uint32_t size)
{
    std::lock_guard<std::mutex> lock(mtx_);
    XI_RETURN err;
    if (take_failure("xiGetParam", err) || take_failure(std::string("xiGetParam:") + name, err))
        return err;
    Device* dev = find(handle);
    if (!dev) return XI_INVALID_HANDLE;

    std::string text;
    if (std::strcmp(name, XI_PRM_DEVICE_NAME) == 0)
        text = opts_.model;
    else if (std::strcmp(name, XI_PRM_DEVICE_SN) == 0)
        text = "FAKE" + std::to_string(10000 + dev->index);
    else
        return dev->params.count(name) ? XI_WRONG_PARAM_TYPE : XI_NOT_SUPPORTED_PARAM;

    if (text.size() + 1 > size) return XI_BUFFER_TOO_SMALL;
    std::memcpy(value, text.c_str(), text.size() + 1);
    return XI_OK;
}

// --------------- test hooks ---------------
void FakeDriver::fail_next(const std::string& call, XI_RETURN code)
{
    std::lock_guard<std::mutex> lock(mtx_);
    failures_[call] = code;
}

size_t FakeDriver::open_devices() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return devices_.size();
}

size_t FakeDriver::close_calls() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return close_calls_;
}

bool FakeDriver::acquiring(HANDLE handle) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    Device* dev = find(handle);
    return dev && dev->acquiring;
}

size_t FakeDriver::write_count(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = writes_.find(name);
    return it == writes_.end() ? 0 : it->second;
}

} // namespace xicam_ng
