#include <gtest/gtest.h>
#include <memory>

#include "xicam_ng/Device.hpp"
#include "xicam_ng/FakeDriver.hpp"
#include "xicam_ng/StreamingSession.hpp"
#include "xicam_ng/XiError.hpp"

using namespace xicam_ng;

class RoiCounterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDriver> driver = std::make_shared<FakeDriver>();
};

// Every value is rounded down to its increment before it is written.
TEST_F(RoiCounterTest, SetRoiRoundsDown) {
    auto cam = open_device(0, driver);
    const Roi applied = cam.set_roi({17, 5, 650, 481});

    EXPECT_EQ(applied.width, 640u);      // width increment 16
    EXPECT_EQ(applied.height, 480u);     // height increment 2
    EXPECT_EQ(applied.offset_x, 16u);
    EXPECT_EQ(applied.offset_y, 4u);
    EXPECT_EQ(cam.roi(), applied);
}

// Applying the returned ROI again changes nothing.
TEST_F(RoiCounterTest, SetRoiIsIdempotent) {
    auto cam = open_device(0, driver);
    const Roi first = cam.set_roi({100, 33, 333, 201});
    const Roi second = cam.set_roi(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ(cam.roi(), first);
}

// Offsets are cleared first, so growing back to full frame from a shifted ROI works.
TEST_F(RoiCounterTest, GrowFromShiftedRoi) {
    auto cam = open_device(0, driver);
    cam.set_roi({640, 512, 640, 512});
    const Roi full = cam.set_roi({0, 0, 1280, 1024});
    EXPECT_EQ(full, (Roi{0, 0, 1280, 1024}));
}

// The ROI read works while streaming and matches the frame geometry.
TEST_F(RoiCounterTest, RoiMatchesFrames) {
    auto cam = open_device(0, driver);
    const Roi roi = cam.set_roi({32, 10, 256, 128});
    auto stream = std::move(cam).start();

    EXPECT_EQ(stream.roi(), roi);
    auto img = stream.next_image(1000);
    EXPECT_EQ(img.width(), roi.width);
    EXPECT_EQ(img.height(), roi.height);
    EXPECT_EQ(img.absolute_offset_x(), roi.offset_x);
    EXPECT_EQ(img.absolute_offset_y(), roi.offset_y);
}

TEST_F(RoiCounterTest, ParameterInfo) {
    auto cam = open_device(0, driver);
    EXPECT_EQ(cam.increment(prm::width), 16);
    EXPECT_EQ(cam.maximum(prm::width), 1280);
    EXPECT_EQ(cam.minimum(prm::height), 2);
    EXPECT_FLOAT_EQ(cam.increment(prm::exposure), 10.0f);
}

// counter() reads the requested counter and puts the previous selector back.
TEST_F(RoiCounterTest, CounterRestoresSelector) {
    auto cam = open_device(0, driver);
    cam.set(prm::counter_selector, XI_CNT_SEL_API_SKIPPED_FRAMES);
    auto stream = std::move(cam).start();

    for (int i = 0; i < 3; ++i) stream.next_image(1000);

    EXPECT_EQ(stream.counter(XI_CNT_SEL_TRANSPORT_TRANSFERRED_FRAMES), 3);
    EXPECT_EQ(stream.counter(XI_CNT_SEL_TRANSPORT_SKIPPED_FRAMES), 0);
    EXPECT_EQ(stream.get(prm::counter_selector), XI_CNT_SEL_API_SKIPPED_FRAMES);
}

// The selector is restored even when reading the counter fails.
TEST_F(RoiCounterTest, CounterRestoresSelectorOnFailure) {
    auto cam = open_device(0, driver);
    cam.set(prm::counter_selector, XI_CNT_SEL_API_SKIPPED_FRAMES);

    driver->fail_next(std::string("xiGetParam:") + XI_PRM_COUNTER_VALUE, XI_NOT_SUPPORTED);
    try {
        cam.counter(XI_CNT_SEL_TRANSPORT_TRANSFERRED_FRAMES);
        FAIL() << "counter read should have failed";
    } catch (const XiError& e) {
        EXPECT_TRUE(e.is_not_supported());
    }
    EXPECT_EQ(cam.get(prm::counter_selector), XI_CNT_SEL_API_SKIPPED_FRAMES);
}

// Manual bandwidth: limit applied on the device, global auto measurement restored.
TEST_F(RoiCounterTest, ManualBandwidthRestoresGlobal) {
    auto cam = open_device_manual_bandwidth(0, 1000, driver);
    EXPECT_EQ(cam.get(prm::limit_bandwidth_mode), XI_ON);
    EXPECT_EQ(cam.get(prm::limit_bandwidth), 1000);

    int auto_bw = -1;
    ASSERT_EQ(driver->get_param_int(nullptr, XI_PRM_AUTO_BANDWIDTH_CALCULATION, &auto_bw), XI_OK);
    EXPECT_EQ(auto_bw, XI_ON);
    EXPECT_EQ(driver->write_count(XI_PRM_AUTO_BANDWIDTH_CALCULATION), 2u);   // off, then restore
}

// A failed open still restores the global setting.
TEST_F(RoiCounterTest, ManualBandwidthRestoresGlobalOnFailure) {
    driver->fail_next("xiOpenDevice", XI_INVALID_ARG);
    EXPECT_THROW(open_device_manual_bandwidth(0, 1000, driver), XiError);

    int auto_bw = -1;
    ASSERT_EQ(driver->get_param_int(nullptr, XI_PRM_AUTO_BANDWIDTH_CALCULATION, &auto_bw), XI_OK);
    EXPECT_EQ(auto_bw, XI_ON);
    EXPECT_EQ(driver->open_devices(), 0u);
}

TEST_F(RoiCounterTest, DebugLevelIsGlobal) {
    set_debug_level(XI_DL_ERROR, driver);
    int level = -1;
    ASSERT_EQ(driver->get_param_int(nullptr, XI_PRM_DEBUG_LEVEL, &level), XI_OK);
    EXPECT_EQ(level, XI_DL_ERROR);
}

TEST(RoundDown, Increments) {
    EXPECT_EQ(detail::round_down(650, 16), 640u);
    EXPECT_EQ(detail::round_down(640, 16), 640u);
    EXPECT_EQ(detail::round_down(15, 16), 0u);
    EXPECT_EQ(detail::round_down(7, 1), 7u);
    EXPECT_EQ(detail::round_down(7, 0), 7u);
}
