#include "xicam_ng/Device.hpp"
#include "xicam_ng/ParamAccess.hpp"
#include "xicam_ng/ScopedGlobalParam.hpp"
#include "xicam_ng/XiApiDriver.hpp"
#include "xicam_ng/XiError.hpp"

namespace xicam_ng {

std::shared_ptr<IDriver> default_driver()
{
    static std::shared_ptr<IDriver> driver = std::make_shared<XiApiDriver>();
    return driver;
}

uint32_t number_devices(const std::shared_ptr<IDriver>& driver)
{
    uint32_t count = 0;
    check(driver->get_number_devices(&count), "xiGetNumberDevices");
    return count;
}

ConfigurableSession open_device(uint32_t device_index, const std::shared_ptr<IDriver>& driver)
{
    HANDLE handle = nullptr;
    check(driver->open_device(device_index, &handle),
          "xiOpenDevice(" + std::to_string(device_index) + ")");
    return ConfigurableSession(DeviceHandle(driver, handle));
}

ConfigurableSession open_device_manual_bandwidth(uint32_t device_index, int bandwidth_mbps,
                                                 const std::shared_ptr<IDriver>& driver)
{
    ConfigurableSession cam = [&] {
        ScopedGlobalParam<XI_SWITCH> manual(*driver, prm::auto_bandwidth_calculation, XI_OFF);
        return open_device(device_index, driver);
    }();

    cam.set(prm::limit_bandwidth_mode, XI_ON);
    cam.set(prm::limit_bandwidth, bandwidth_mbps);
    return cam;
}

void set_debug_level(XI_DEBUG_LEVEL level, const std::shared_ptr<IDriver>& driver)
{
    detail::write_param(*driver, nullptr, prm::debug_level.name, level);
}

} // namespace xicam_ng
