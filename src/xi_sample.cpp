#include "xicam_ng/Device.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"
#include <iostream>
#include <string>

// Grab a few frames from the first camera and print what arrived.
// Usage: xi_sample [frames] [exposure_us]
int main(int argc, char** argv)
{
    const int frames = argc > 1 ? std::stoi(argv[1]) : 10;
    const float exposure = argc > 2 ? std::stof(argv[2]) : 10000.0f;

    try {
        auto cam = xicam_ng::open_device(0);
        cam.set(xicam_ng::prm::exposure, exposure);

        auto stream = std::move(cam).start();
        for (int i = 0; i < frames; ++i) {
            auto image = stream.next_image<uint8_t>();
            const uint8_t* first = image.pixel(0, 0);
            std::cout << "Image " << i << " (" << image.width() << "x" << image.height()
                      << ") received from camera. First pixel value: "
                      << (first ? int(*first) : -1) << "\n";
            std::cout << "data buffer length: " << image.data().size() << "\n";
            std::cout << "image format: " << image.format() << "\n";
        }
        std::move(stream).stop();
    } catch (const xicam_ng::XiError& e) {
        std::cerr << e.what() << std::endl;
        return e.code();
    }
    return 0;
}
