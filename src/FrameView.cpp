#include "xicam_ng/FrameView.hpp"

namespace xicam_ng {

uint32_t channel_count(XI_IMG_FORMAT format)
{
    switch (format) {
    case XI_MONO8:
    case XI_MONO16:
    case XI_RAW8:
    case XI_RAW16:
        return 1;
    case XI_RGB24:
        return 3;
    case XI_RGB32:
        return 4;
    default:
        return 0;
    }
}

uint32_t element_size(XI_IMG_FORMAT format)
{
    switch (format) {
    case XI_MONO8:
    case XI_RAW8:
    case XI_RGB24:
    case XI_RGB32:
        return 1;
    case XI_MONO16:
    case XI_RAW16:
        return 2;
    default:
        return 0;
    }
}

} // namespace xicam_ng
