#include "xicam_ng/ParamAccess.hpp"

namespace xicam_ng {
namespace detail {

uint32_t round_down(uint32_t value, int increment)
{
    if (increment <= 1) return value;
    const uint32_t inc = static_cast<uint32_t>(increment);
    return value - value % inc;
}

Roi read_roi(IDriver& d, HANDLE h)
{
    Roi roi;
    roi.offset_x = static_cast<uint32_t>(read_param<int>(d, h, prm::offset_x.name));
    roi.offset_y = static_cast<uint32_t>(read_param<int>(d, h, prm::offset_y.name));
    roi.width    = static_cast<uint32_t>(read_param<int>(d, h, prm::width.name));
    roi.height   = static_cast<uint32_t>(read_param<int>(d, h, prm::height.name));
    return roi;
}

Roi write_roi(IDriver& d, HANDLE h, const Roi& roi)
{
    // Offsets go to zero first so no intermediate offset+size exceeds the sensor.
    write_param<int>(d, h, prm::offset_x.name, 0);
    write_param<int>(d, h, prm::offset_y.name, 0);

    Roi actual;
    actual.width = round_down(roi.width, read_info<int>(d, h, prm::width.name, XI_PRM_INFO_INCREMENT));
    write_param<int>(d, h, prm::width.name, static_cast<int>(actual.width));

    actual.height = round_down(roi.height, read_info<int>(d, h, prm::height.name, XI_PRM_INFO_INCREMENT));
    write_param<int>(d, h, prm::height.name, static_cast<int>(actual.height));

    actual.offset_x = round_down(roi.offset_x, read_info<int>(d, h, prm::offset_x.name, XI_PRM_INFO_INCREMENT));
    write_param<int>(d, h, prm::offset_x.name, static_cast<int>(actual.offset_x));

    actual.offset_y = round_down(roi.offset_y, read_info<int>(d, h, prm::offset_y.name, XI_PRM_INFO_INCREMENT));
    write_param<int>(d, h, prm::offset_y.name, static_cast<int>(actual.offset_y));

    return actual;
}

int read_counter(IDriver& d, HANDLE h, XI_COUNTER_SELECTOR counter)
{
    using SelectorIo = ParamIo<XI_COUNTER_SELECTOR>;

    const auto saved = read_param<XI_COUNTER_SELECTOR>(d, h, prm::counter_selector.name);
    write_param(d, h, prm::counter_selector.name, counter);

    int value = 0;
    XI_RETURN read_err = d.get_param_int(h, prm::counter_value.name, &value);
    // The selector is restored even when the read failed.
    XI_RETURN restore_err = SelectorIo::set(d, h, prm::counter_selector.name, saved);

    check(read_err, std::string("xiGetParam(") + prm::counter_value.name + ")");
    check(restore_err, std::string("xiSetParam(") + prm::counter_selector.name + ")");
    return value;
}

} // namespace detail
} // namespace xicam_ng
