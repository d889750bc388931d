#pragma once
#include <cstdint>

namespace xicam_ng {

/// Rectangular sub-window of the sensor that is read out.
struct Roi {
    uint32_t offset_x = 0;
    uint32_t offset_y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const Roi& o) const
    {
        return offset_x == o.offset_x && offset_y == o.offset_y &&
               width == o.width && height == o.height;
    }
    bool operator!=(const Roi& o) const { return !(*this == o); }
};

} // namespace xicam_ng
