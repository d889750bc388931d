#include "xicam_ng/DeviceHandle.hpp"
#include "xicam_ng/XiError.hpp"
#include <iostream>
#include <utility>

namespace xicam_ng {

DeviceHandle::DeviceHandle(std::shared_ptr<IDriver> driver, HANDLE handle)
    : driver_(std::move(driver)), handle_(handle)
{}

DeviceHandle::DeviceHandle(DeviceHandle&& other) noexcept
    : driver_(std::move(other.driver_)), handle_(other.handle_)
{
    other.handle_ = nullptr;
}

DeviceHandle& DeviceHandle::operator=(DeviceHandle&& other) noexcept
{
    if (this != &other) {
        close();
        driver_ = std::move(other.driver_);
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

HANDLE DeviceHandle::checked() const
{
    if (!handle_ || !driver_) throw XiError(XI_INVALID_HANDLE, "DeviceHandle");
    return handle_;
}

IDriver& DeviceHandle::driver() const
{
    if (!driver_) throw XiError(XI_INVALID_HANDLE, "DeviceHandle");
    return *driver_;
}

void DeviceHandle::close()
{
    if (handle_ && driver_) {
        XI_RETURN stat = driver_->close_device(handle_);
        if (stat != XI_OK)
            std::cerr << "[DeviceHandle] xiCloseDevice failed: "
                      << xi_error_name(stat) << " (" << stat << ")\n";
    }
    handle_ = nullptr;
    driver_.reset();
}

} // namespace xicam_ng
