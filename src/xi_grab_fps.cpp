#include "xicam_ng/Device.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <chrono>
#include <iostream>
#include <string>

namespace {

void print_camera_info(const xicam_ng::ConfigurableSession& cam)
{
    using namespace xicam_ng;
    const Roi roi = cam.roi();

    std::cout << "\n=== XIMEA Camera Info ===\n";
    std::cout << "Model:     " << cam.device_name() << "\n";
    std::cout << "Serial:    " << cam.device_serial() << "\n";
    std::cout << "ROI:       " << roi.width << "x" << roi.height
              << " @ (" << roi.offset_x << "," << roi.offset_y << ")\n";
    std::cout << "Exposure:  " << cam.get(prm::exposure) << " us\n";
    std::cout << "Gain:      " << cam.get(prm::gain) << " dB\n";
    std::cout << "Framerate: " << cam.get(prm::framerate) << " fps\n";
    std::cout << "Format:    " << cam.get(prm::image_data_format) << " (XI_RAW8=5, XI_MONO8=0, etc.)\n";
    std::cout << "==========================\n\n";
}

}  // namespace

// Usage: xi_grab_fps [frames] [target_fps] [bandwidth_mbps]
int main(int argc, char** argv)
{
    const int test_frames = argc > 1 ? std::stoi(argv[1]) : 500;
    const float target_fps = argc > 2 ? std::stof(argv[2]) : 300.0f;
    const int bandwidth = argc > 3 ? std::stoi(argv[3]) : 0;

    try {
        auto cam = bandwidth > 0 ? xicam_ng::open_device_manual_bandwidth(0, bandwidth)
                                 : xicam_ng::open_device(0);

        // Known baseline settings
        cam.set(xicam_ng::prm::image_data_format, XI_RAW8);
        cam.set(xicam_ng::prm::exposure, 1000.0f);
        try {
            cam.set(xicam_ng::prm::acq_timing_mode, XI_ACQ_TIMING_MODE_FRAME_RATE);
            cam.set(xicam_ng::prm::framerate, target_fps);
        } catch (const xicam_ng::XiError& e) {
            if (!e.is_not_supported()) throw;
            std::cerr << "Frame rate control not supported, running free\n";
        }

        print_camera_info(cam);

        auto stream = std::move(cam).start();

        auto start = std::chrono::steady_clock::now();
        int frames = 0;
        for (int i = 0; i < test_frames; ++i) {
            try {
                stream.next_image(100);
                frames++;
            } catch (const xicam_ng::XiError& e) {
                if (!e.is_timeout()) throw;
            }
        }
        auto end = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(end - start).count();

        std::cout << "Captured " << frames << " frames in " << elapsed << " s\n";
        std::cout << "Measured: " << frames / elapsed << " fps\n";
        std::cout << "Skipped (transport): "
                  << stream.counter(XI_CNT_SEL_TRANSPORT_SKIPPED_FRAMES) << "\n";
        std::cout << "Skipped (api):       "
                  << stream.counter(XI_CNT_SEL_API_SKIPPED_FRAMES) << "\n";

        std::move(stream).stop();
    } catch (const xicam_ng::XiError& e) {
        std::cerr << e.what() << std::endl;
        return e.code();
    }
    return 0;
}
