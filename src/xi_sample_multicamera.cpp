#include "xicam_ng/Device.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <iostream>
#include <vector>

// Opens every attached camera in software trigger mode, fires one trigger on
// each and reads one image back from each.
int main()
{
    try {
        const uint32_t count = xicam_ng::number_devices();
        std::cout << "Found " << count << " camera(s)\n";

        std::vector<xicam_ng::StreamingSession> streams;
        streams.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto cam = xicam_ng::open_device(i);
            cam.set(xicam_ng::prm::exposure, 1000.0f);
            cam.set(xicam_ng::prm::trg_source, XI_TRG_SOFTWARE);
            std::cout << "Camera " << i << ": " << cam.device_name()
                      << " SN " << cam.device_serial() << "\n";
            streams.push_back(std::move(cam).start());
        }

        for (auto& s : streams)
            s.software_trigger();

        for (auto& s : streams) {
            auto img = s.next_image<uint8_t>(5000);
            std::cout << "Received image! Width: " << img.width()
                      << ", Height: " << img.height() << "\n";
        }
    } catch (const xicam_ng::XiError& e) {
        std::cerr << e.what() << std::endl;
        return e.code();
    }
    return 0;
}
