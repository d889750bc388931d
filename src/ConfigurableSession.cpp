#include "xicam_ng/ConfigurableSession.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include <utility>
#include <vector>

namespace xicam_ng {

ConfigurableSession::ConfigurableSession(DeviceHandle handle)
    : handle_(std::move(handle))
{}

StreamingSession ConfigurableSession::start() &&
{
    HANDLE h = handle_.checked();
    IDriver& driver = handle_.driver();

    std::vector<uint8_t> safe_buffer;
    if (get(prm::buffer_policy) == XI_BP_SAFE)
        safe_buffer.resize(static_cast<size_t>(get(prm::image_payload_size)));

    check(driver.start_acquisition(h), "xiStartAcquisition");
    // Nothing has been moved yet, so a throw above leaves *this intact.
    return StreamingSession(std::move(*this), std::move(safe_buffer));
}

Roi ConfigurableSession::roi() const
{
    return detail::read_roi(handle_.driver(), handle_.checked());
}

Roi ConfigurableSession::set_roi(const Roi& roi)
{
    return detail::write_roi(handle_.driver(), handle_.checked(), roi);
}

int ConfigurableSession::counter(XI_COUNTER_SELECTOR counter)
{
    return detail::read_counter(handle_.driver(), handle_.checked(), counter);
}

} // namespace xicam_ng
