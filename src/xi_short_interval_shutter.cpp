#include "xicam_ng/Device.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <sstream>
#include <string>

// Two exposures from one software trigger with the short interval shutter
// feature (only available on some models).
// Usage: xi_short_interval_shutter [device_index] [bandwidth_mbps]
int main(int argc, char** argv)
{
    const uint32_t index = argc > 1 ? static_cast<uint32_t>(std::stoul(argv[1])) : 0;
    const int bandwidth = argc > 2 ? std::stoi(argv[2]) : 2500;

    try {
        // Manual bandwidth keeps the sensor clocks the same between runs
        auto cam = xicam_ng::open_device_manual_bandwidth(index, bandwidth);

        cam.set(xicam_ng::prm::image_data_format, XI_MONO8);
        cam.set(xicam_ng::prm::sensor_feature_selector, XI_SENSOR_FEATURE_SHORT_INTERVAL_SHUTTER);
        cam.set(xicam_ng::prm::sensor_feature_value, 1);
        cam.set(xicam_ng::prm::trg_source, XI_TRG_SOFTWARE);

        auto stream = std::move(cam).start();
        stream.software_trigger();

        for (int i = 0; i < 2; ++i) {
            auto img = stream.next_image<uint8_t>(5000);
            // step carries the row padding
            cv::Mat frame(static_cast<int>(img.height()), static_cast<int>(img.width()), CV_8UC1,
                          const_cast<uint8_t*>(img.bytes()), img.stride_bytes());

            std::ostringstream name;
            name << "short_interval_shutter_test" << i << ".png";
            if (!cv::imwrite(name.str(), frame)) {
                std::cerr << "Failed to write " << name.str() << "\n";
                return 1;
            }
            std::cout << "Saved " << name.str() << " (" << img.width() << "x" << img.height()
                      << ", exposure " << img.exposure_time_us() << " us)\n";
        }
        std::move(stream).stop();
    } catch (const xicam_ng::XiError& e) {
        std::cerr << e.what() << std::endl;
        return e.code();
    }
    return 0;
}
