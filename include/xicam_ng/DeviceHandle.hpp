#pragma once
#include "xicam_ng/IDriver.hpp"
#include <m3api/xiApi.h>
#include <memory>

namespace xicam_ng {

/**
 * @brief Exclusive owner of one open xiAPI device handle.
 *
 * Move-only. The handle is closed exactly once, when the owning instance is
 * destroyed or assigned over. A moved-from instance owns nothing.
 */
class DeviceHandle {
public:
    DeviceHandle() = default;
    DeviceHandle(std::shared_ptr<IDriver> driver, HANDLE handle);
    ~DeviceHandle() { close(); }

    DeviceHandle(DeviceHandle&& other) noexcept;
    DeviceHandle& operator=(DeviceHandle&& other) noexcept;
    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    explicit operator bool() const { return handle_ != nullptr; }

    /// Raw handle, nullptr when empty.
    HANDLE get() const { return handle_; }

    /// Raw handle; throws XiError(XI_INVALID_HANDLE) when empty.
    HANDLE checked() const;

    /// Driver the handle was opened with; throws XiError(XI_INVALID_HANDLE) when empty.
    IDriver& driver() const;

private:
    void close();

    std::shared_ptr<IDriver> driver_;
    HANDLE handle_{nullptr};
};

} // namespace xicam_ng
