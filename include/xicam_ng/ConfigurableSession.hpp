#pragma once
#include "xicam_ng/DeviceHandle.hpp"
#include "xicam_ng/ParamAccess.hpp"
#include "xicam_ng/Params.hpp"
#include "xicam_ng/Roi.hpp"
#include <m3api/xiApi.h>
#include <string>

namespace xicam_ng {

class StreamingSession;

/**
 * @brief An open camera that is not acquiring.
 *
 * While an instance exists the device is guaranteed not to stream, so every
 * writable parameter may be changed. Move-only; destroying it closes the
 * device. start() consumes the session and hands the device to a
 * StreamingSession.
 *
 * Const members only read and may be called from several threads at once.
 * Anything that writes needs a non-const reference, and the caller has to
 * serialize those.
 */
class ConfigurableSession {
public:
    explicit ConfigurableSession(DeviceHandle handle);

    ConfigurableSession(ConfigurableSession&&) noexcept = default;
    ConfigurableSession& operator=(ConfigurableSession&&) noexcept = default;
    ConfigurableSession(const ConfigurableSession&) = delete;
    ConfigurableSession& operator=(const ConfigurableSession&) = delete;
    ~ConfigurableSession() = default;

    /**
     * Starts acquisition and moves the device into a StreamingSession.
     *
     * Throws XiError if xiStartAcquisition fails; the session is then left
     * untouched and still owns the device.
     */
    StreamingSession start() &&;

    template <typename T, Access A>
    T get(Param<T, A> p) const
    {
        return detail::read_param<T>(handle_.driver(), handle_.checked(), p.name);
    }

    template <typename T>
    void set(Param<T, Access::ReadWrite> p, typename detail::NonDeduced<T>::type value)
    {
        detail::write_param<T>(handle_.driver(), handle_.checked(), p.name, value);
    }

    template <typename T, Access A>
    T minimum(Param<T, A> p) const { return info<T>(p.name, XI_PRM_INFO_MIN); }

    template <typename T, Access A>
    T maximum(Param<T, A> p) const { return info<T>(p.name, XI_PRM_INFO_MAX); }

    template <typename T, Access A>
    T increment(Param<T, A> p) const { return info<T>(p.name, XI_PRM_INFO_INCREMENT); }

    /// Current ROI; the four values are read one after another, not atomically.
    Roi roi() const;

    /**
     * Applies a ROI, rounding width, height and offsets down to the
     * increments the camera reports. Returns the ROI actually applied.
     */
    Roi set_roi(const Roi& roi);

    /// Reads one counter and restores the previously selected counter.
    int counter(XI_COUNTER_SELECTOR counter);

    std::string device_name() const { return get(prm::device_name); }
    std::string device_serial() const { return get(prm::device_sn); }

    /// The raw xiAPI handle for calls this wrapper does not cover.
    HANDLE native_handle() const { return handle_.get(); }

    explicit operator bool() const { return static_cast<bool>(handle_); }

private:
    friend class StreamingSession;

    template <typename T>
    T info(const char* name, const char* modifier) const
    {
        return detail::read_info<T>(handle_.driver(), handle_.checked(), name, modifier);
    }

    DeviceHandle handle_;
};

} // namespace xicam_ng
