#pragma once
#include <m3api/xiApi.h>
#include <cstdint>

namespace xicam_ng {

/**
 * @brief The device-driver primitives the sessions are built on.
 *
 * Mirrors the xiAPI C entry points one to one. Every call returns the raw
 * XI_RETURN code; a null handle addresses the global (pre-open) parameters.
 */
class IDriver {
public:
    virtual ~IDriver() = default;

    virtual XI_RETURN get_number_devices(uint32_t* count) = 0;
    virtual XI_RETURN open_device(uint32_t device_index, HANDLE* handle) = 0;
    virtual XI_RETURN close_device(HANDLE handle) = 0;

    virtual XI_RETURN start_acquisition(HANDLE handle) = 0;
    virtual XI_RETURN stop_acquisition(HANDLE handle) = 0;

    virtual XI_RETURN get_param_int(HANDLE handle, const char* name, int* value) = 0;
    virtual XI_RETURN set_param_int(HANDLE handle, const char* name, int value) = 0;
    virtual XI_RETURN get_param_float(HANDLE handle, const char* name, float* value) = 0;
    virtual XI_RETURN set_param_float(HANDLE handle, const char* name, float value) = 0;
    virtual XI_RETURN get_param_string(HANDLE handle, const char* name, char* value, uint32_t size) = 0;

    /// Blocks until a frame arrives or timeout_ms elapses. image->size must be sizeof(XI_IMG).
    virtual XI_RETURN get_image(HANDLE handle, uint32_t timeout_ms, XI_IMG* image) = 0;
};

} // namespace xicam_ng
