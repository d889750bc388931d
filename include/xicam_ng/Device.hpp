#pragma once
#include "xicam_ng/ConfigurableSession.hpp"
#include "xicam_ng/IDriver.hpp"
#include <m3api/xiApi.h>
#include <cstdint>
#include <memory>

namespace xicam_ng {

/// Process-wide XiApiDriver used when no driver is passed explicitly.
std::shared_ptr<IDriver> default_driver();

/// Number of cameras the driver can see.
uint32_t number_devices(const std::shared_ptr<IDriver>& driver = default_driver());

/**
 * Opens camera `device_index` (0 is the first camera in the system).
 *
 * Opening the same camera from two processes at once is possible but not
 * recommended. Throws XiError on failure.
 */
ConfigurableSession open_device(uint32_t device_index = 0,
                                const std::shared_ptr<IDriver>& driver = default_driver());

/**
 * Opens a camera with automatic bandwidth measurement switched off and the
 * link limited to `bandwidth_mbps`. Sensor clocks then stay the same from run
 * to run. The global auto_bandwidth_calculation setting is restored before
 * this returns, whether or not the open succeeded.
 */
ConfigurableSession open_device_manual_bandwidth(uint32_t device_index, int bandwidth_mbps,
                                                 const std::shared_ptr<IDriver>& driver = default_driver());

/// Sets the xiAPI debug output level for the whole process.
void set_debug_level(XI_DEBUG_LEVEL level,
                     const std::shared_ptr<IDriver>& driver = default_driver());

} // namespace xicam_ng
