#pragma once
#include <m3api/xiApi.h>
#include <string>

namespace xicam_ng {

enum class Access { ReadOnly, ReadWrite };

/**
 * @brief A typed xiAPI parameter key.
 *
 * `T` is the value type (int, float, an xiAPI enumeration or std::string),
 * `A` whether ConfigurableSession::set accepts it. `live` marks keys the driver
 * documents as changeable while acquisition is running; only those get a
 * setter on StreamingSession.
 */
template <typename T, Access A = Access::ReadWrite>
struct Param {
    using value_type = T;
    static constexpr Access access = A;

    const char* name;
    bool live;
};

namespace prm {

// Exposure and gain
constexpr Param<float> exposure{XI_PRM_EXPOSURE, true};
constexpr Param<int> exposure_burst_count{XI_PRM_EXPOSURE_BURST_COUNT, true};
constexpr Param<float> gain{XI_PRM_GAIN, true};
constexpr Param<XI_GAIN_SELECTOR_TYPE> gain_selector{XI_PRM_GAIN_SELECTOR, true};

// Image format, ROI and downsampling
constexpr Param<XI_IMG_FORMAT> image_data_format{XI_PRM_IMAGE_DATA_FORMAT, false};
constexpr Param<int> width{XI_PRM_WIDTH, false};
constexpr Param<int> height{XI_PRM_HEIGHT, false};
constexpr Param<int> offset_x{XI_PRM_OFFSET_X, false};
constexpr Param<int> offset_y{XI_PRM_OFFSET_Y, false};
constexpr Param<XI_DOWNSAMPLING_VALUE> downsampling{XI_PRM_DOWNSAMPLING, false};
constexpr Param<XI_DOWNSAMPLING_TYPE> downsampling_type{XI_PRM_DOWNSAMPLING_TYPE, false};
constexpr Param<int, Access::ReadOnly> image_payload_size{XI_PRM_IMAGE_PAYLOAD_SIZE, false};

// Timing
constexpr Param<float> framerate{XI_PRM_FRAMERATE, false};
constexpr Param<XI_ACQ_TIMING_MODE> acq_timing_mode{XI_PRM_ACQ_TIMING_MODE, false};

// Trigger and IO lines
constexpr Param<XI_TRG_SOURCE> trg_source{XI_PRM_TRG_SOURCE, false};
constexpr Param<XI_TRG_SELECTOR> trg_selector{XI_PRM_TRG_SELECTOR, false};
constexpr Param<int> trg_software{XI_PRM_TRG_SOFTWARE, true};
constexpr Param<int> gpi_selector{XI_PRM_GPI_SELECTOR, false};
constexpr Param<XI_GPI_MODE> gpi_mode{XI_PRM_GPI_MODE, false};
constexpr Param<int, Access::ReadOnly> gpi_level{XI_PRM_GPI_LEVEL, false};
constexpr Param<int> gpo_selector{XI_PRM_GPO_SELECTOR, true};
constexpr Param<XI_GPO_MODE> gpo_mode{XI_PRM_GPO_MODE, true};
constexpr Param<XI_LED_SELECTOR> led_selector{XI_PRM_LED_SELECTOR, true};
constexpr Param<XI_LED_MODE> led_mode{XI_PRM_LED_MODE, true};

constexpr Param<XI_TEST_PATTERN> test_pattern{XI_PRM_TEST_PATTERN, false};

// Acquisition buffer
constexpr Param<int> acq_buffer_size{XI_PRM_ACQ_BUFFER_SIZE, false};
constexpr Param<int> buffers_queue_size{XI_PRM_BUFFERS_QUEUE_SIZE, false};
constexpr Param<XI_BP> buffer_policy{XI_PRM_BUFFER_POLICY, false};
constexpr Param<int> image_user_data{XI_PRM_IMAGE_USER_DATA, true};

// Bandwidth
constexpr Param<int, Access::ReadOnly> available_bandwidth{XI_PRM_AVAILABLE_BANDWIDTH, false};
constexpr Param<int> limit_bandwidth{XI_PRM_LIMIT_BANDWIDTH, false};
constexpr Param<XI_SWITCH> limit_bandwidth_mode{XI_PRM_LIMIT_BANDWIDTH_MODE, false};

// Sensor features
constexpr Param<XI_SENSOR_FEATURE_SELECTOR> sensor_feature_selector{XI_PRM_SENSOR_FEATURE_SELECTOR, false};
constexpr Param<int> sensor_feature_value{XI_PRM_SENSOR_FEATURE_VALUE, false};

// Counters share one selector register. counter() writes the selector itself in
// either phase, so it has no streaming setter.
constexpr Param<XI_COUNTER_SELECTOR> counter_selector{XI_PRM_COUNTER_SELECTOR, false};
constexpr Param<int, Access::ReadOnly> counter_value{XI_PRM_COUNTER_VALUE, false};

// Device info
constexpr Param<std::string, Access::ReadOnly> device_name{XI_PRM_DEVICE_NAME, false};
constexpr Param<std::string, Access::ReadOnly> device_sn{XI_PRM_DEVICE_SN, false};

// Global, addressed through the null handle before a device is opened
constexpr Param<XI_SWITCH> auto_bandwidth_calculation{XI_PRM_AUTO_BANDWIDTH_CALCULATION, false};
constexpr Param<XI_DEBUG_LEVEL> debug_level{XI_PRM_DEBUG_LEVEL, false};

} // namespace prm

} // namespace xicam_ng
