#pragma once
#include "xicam_ng/IDriver.hpp"
#include <m3api/xiApi.h>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xicam_ng {

/**
 * @brief In-memory camera that answers the xiAPI primitives.
 *
 * Generates moving gradient frames, keeps a parameter store with min/max/inc
 * info, quantizes exposure and gain like a sensor would, rejects ROI values
 * off the increment grid or outside the sensor, supports software and
 * (never firing) hardware triggers, and tracks the counter selector. Used by
 * the unit tests and by the node's "fake" backend.
 */
class FakeDriver : public IDriver {
public:
    struct Options {
        uint32_t devices = 1;
        uint32_t sensor_width = 1280;
        uint32_t sensor_height = 1024;
        uint32_t width_increment = 16;
        uint32_t height_increment = 2;
        uint32_t offset_x_increment = 16;
        uint32_t offset_y_increment = 2;
        uint32_t padding_x = 0;       // extra bytes after each row
        float exposure_step_us = 10.0f;
        float gain_step_db = 0.1f;
        std::string model = "MQ013MG-FAKE";
    };

    FakeDriver();
    explicit FakeDriver(Options options);
    ~FakeDriver() override;

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

    /// Makes the next call of `call` ("xiStartAcquisition", "xiGetImage", ...) return `code`.
    void fail_next(const std::string& call, XI_RETURN code);

    size_t open_devices() const;
    size_t close_calls() const;
    bool acquiring(HANDLE handle) const;
    /// Number of parameter writes issued so far, per parameter name.
    size_t write_count(const std::string& name) const;

private:
    struct Setting {
        double value = 0;
        double min = 0;
        double max = 0;
        double inc = 1;
        bool is_float = false;
        bool read_only = false;
        bool live = false;
        bool quantize = false;   // round to inc instead of rejecting
    };
    struct Device;

    Device* find(HANDLE handle) const;
    bool take_failure(const std::string& call, XI_RETURN& code);
    XI_RETURN read(HANDLE handle, const std::string& name, double& value);
    XI_RETURN write(HANDLE handle, const std::string& name, double value);
    void refresh_limits(Device& dev);
    void render(Device& dev);

    Options opts_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Device>> devices_;
    std::map<std::string, double> globals_;
    std::map<std::string, XI_RETURN> failures_;
    std::map<std::string, size_t> writes_;
    size_t close_calls_ = 0;
};

} // namespace xicam_ng
