#include <m3api/xiApi.h>
#include "xicam_ng/XiApiDriver.hpp"

namespace xicam_ng {

XI_RETURN XiApiDriver::get_number_devices(uint32_t* count)
{
    DWORD n = 0;
    XI_RETURN stat = xiGetNumberDevices(&n);
    if (stat == XI_OK) *count = static_cast<uint32_t>(n);
    return stat;
}

XI_RETURN XiApiDriver::open_device(uint32_t device_index, HANDLE* handle)
{
    return xiOpenDevice(device_index, handle);
}

XI_RETURN XiApiDriver::close_device(HANDLE handle)
{
    return xiCloseDevice(handle);
}

XI_RETURN XiApiDriver::start_acquisition(HANDLE handle)
{
    return xiStartAcquisition(handle);
}

XI_RETURN XiApiDriver::stop_acquisition(HANDLE handle)
{
    return xiStopAcquisition(handle);
}

XI_RETURN XiApiDriver::get_param_int(HANDLE handle, const char* name, int* value)
{
    return xiGetParamInt(handle, name, value);
}

XI_RETURN XiApiDriver::set_param_int(HANDLE handle, const char* name, int value)
{
    return xiSetParamInt(handle, name, value);
}

XI_RETURN XiApiDriver::get_param_float(HANDLE handle, const char* name, float* value)
{
    return xiGetParamFloat(handle, name, value);
}

XI_RETURN XiApiDriver::set_param_float(HANDLE handle, const char* name, float value)
{
    return xiSetParamFloat(handle, name, value);
}

XI_RETURN XiApiDriver::get_param_string(HANDLE handle, const char* name, char* value, uint32_t size)
{
    return xiGetParamString(handle, name, value, size);
}

XI_RETURN XiApiDriver::get_image(HANDLE handle, uint32_t timeout_ms, XI_IMG* image)
{
    return xiGetImage(handle, timeout_ms, image);
}

} // namespace xicam_ng
