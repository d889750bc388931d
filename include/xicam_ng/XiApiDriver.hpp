#pragma once
#include "xicam_ng/IDriver.hpp"
#include <m3api/xiApi.h>

namespace xicam_ng {

/// IDriver backed by the installed XIMEA m3api library.
class XiApiDriver : public IDriver {
public:
    XiApiDriver() = default;
    ~XiApiDriver() override = default;

    XI_RETURN get_number_devices(uint32_t* count) override;
    XI_RETURN open_device(uint32_t device_index, HANDLE* handle) override;
    XI_RETURN close_device(HANDLE handle) override;

    XI_RETURN start_acquisition(HANDLE handle) override;
    XI_RETURN stop_acquisition(HANDLE handle) override;

    XI_RETURN get_param_int(HANDLE handle, const char* name, int* value) override;
    XI_RETURN set_param_int(HANDLE handle, const char* name, int value) override;
    XI_RETURN get_param_float(HANDLE handle, const char* name, float* value) override;
    XI_RETURN set_param_float(HANDLE handle, const char* name, float value) override;
    XI_RETURN get_param_string(HANDLE handle, const char* name, char* value, uint32_t size) override;

    XI_RETURN get_image(HANDLE handle, uint32_t timeout_ms, XI_IMG* image) override;
};

} // namespace xicam_ng
