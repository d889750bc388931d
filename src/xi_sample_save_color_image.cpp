#include "xicam_ng/Device.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <string>

// Grab one RGB24 frame and save it.
// Usage: xi_sample_save_color_image [output.jpg] [exposure_us]
int main(int argc, char** argv)
{
    const std::string out = argc > 1 ? argv[1] : "example.jpg";
    const float exposure = argc > 2 ? std::stof(argv[2]) : 10000.0f;

    try {
        auto cam = xicam_ng::open_device(0);
        cam.set(xicam_ng::prm::exposure, exposure);
        cam.set(xicam_ng::prm::image_data_format, XI_RGB24);

        auto stream = std::move(cam).start();
        auto img = stream.next_image<uint8_t>(5000);

        // xiAPI RGB24 is B,G,R per pixel, the same order OpenCV expects.
        cv::Mat frame(static_cast<int>(img.height()), static_cast<int>(img.width()), CV_8UC3,
                      const_cast<uint8_t*>(img.bytes()), img.stride_bytes());
        if (!cv::imwrite(out, frame)) {
            std::cerr << "Could not save image to " << out << "\n";
            return 1;
        }
        std::cout << "Saved " << out << " (" << img.width() << "x" << img.height() << ")\n";
    } catch (const xicam_ng::XiError& e) {
        std::cerr << e.what() << std::endl;
        return e.code();
    }
    return 0;
}
