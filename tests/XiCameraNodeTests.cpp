#include <gtest/gtest.h>
#include <rclcpp/rclcpp.hpp>
#include <lifecycle_msgs/msg/state.hpp>
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "xicam_ng/XiCameraNode.hpp"

using xicam_ng::XiCameraNode;
using lifecycle_msgs::msg::State;

namespace {

bool wait_for(const std::function<bool()>& done,
              std::chrono::milliseconds limit = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

class XiCameraNodeTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
    static void TearDownTestSuite() { rclcpp::shutdown(); }

    void SetUp() override
    {
        path_ = ::testing::TempDir() + "xicam_ng_node.avi";
        rclcpp::NodeOptions options;
        options.parameter_overrides({
            rclcpp::Parameter("backend", std::string("fake")),
            rclcpp::Parameter("roi_width", 320),
            rclcpp::Parameter("roi_height", 240),
            rclcpp::Parameter("fps", 100),
            rclcpp::Parameter("exposure_us", 5000.0),
            rclcpp::Parameter("codec", std::string("mpeg4")),
            rclcpp::Parameter("output_path", path_),
            rclcpp::Parameter("grab_timeout_ms", 500),
        });
        node_ = std::make_shared<XiCameraNode>(options);
    }

    void TearDown() override
    {
        node_.reset();
        std::remove(path_.c_str());
    }

    std::string path_;
    std::shared_ptr<XiCameraNode> node_;
};

// configure -> activate -> deactivate -> cleanup on the fake backend.
TEST_F(XiCameraNodeTest, LifecycleRecordsFrames) {
    ASSERT_EQ(node_->configure().id(), State::PRIMARY_STATE_INACTIVE);
    ASSERT_EQ(node_->activate().id(), State::PRIMARY_STATE_ACTIVE);
    EXPECT_TRUE(wait_for([&] { return node_->frames_grabbed() >= 5; }));
    EXPECT_EQ(node_->last_frame_exposure_us(), 5000u);

    EXPECT_EQ(node_->deactivate().id(), State::PRIMARY_STATE_INACTIVE);
    EXPECT_EQ(node_->cleanup().id(), State::PRIMARY_STATE_UNCONFIGURED);
}

// An exposure change while the grab thread runs is accepted at once and lands on later frames.
TEST_F(XiCameraNodeTest, LiveExposureLandsWhileStreaming) {
    ASSERT_EQ(node_->configure().id(), State::PRIMARY_STATE_INACTIVE);
    ASSERT_EQ(node_->activate().id(), State::PRIMARY_STATE_ACTIVE);
    ASSERT_TRUE(wait_for([&] { return node_->frames_grabbed() > 0; }));

    const auto before = std::chrono::steady_clock::now();
    const auto result = node_->set_parameter(rclcpp::Parameter("exposure_us", 2000.0));
    const auto took = std::chrono::steady_clock::now() - before;
    EXPECT_TRUE(result.successful) << result.reason;
    EXPECT_LT(took, std::chrono::milliseconds(250));

    EXPECT_TRUE(wait_for([&] { return node_->last_frame_exposure_us() == 2000u; }));
    node_->deactivate();
}

// Only exposure and gain may change while streaming.
TEST_F(XiCameraNodeTest, RejectsStaticParameterWhileStreaming) {
    ASSERT_EQ(node_->configure().id(), State::PRIMARY_STATE_INACTIVE);
    ASSERT_EQ(node_->activate().id(), State::PRIMARY_STATE_ACTIVE);

    const auto result = node_->set_parameter(rclcpp::Parameter("roi_width", 160));
    EXPECT_FALSE(result.successful);
    EXPECT_EQ(node_->get_parameter("roi_width").as_int(), 320);
    node_->deactivate();
}

// An exposure change between configure and activate reaches the camera.
TEST_F(XiCameraNodeTest, ExposureSetWhileConfiguredApplies) {
    ASSERT_EQ(node_->configure().id(), State::PRIMARY_STATE_INACTIVE);
    const auto result = node_->set_parameter(rclcpp::Parameter("exposure_us", 3000.0));
    EXPECT_TRUE(result.successful) << result.reason;

    ASSERT_EQ(node_->activate().id(), State::PRIMARY_STATE_ACTIVE);
    ASSERT_TRUE(wait_for([&] { return node_->frames_grabbed() > 0; }));
    EXPECT_EQ(node_->last_frame_exposure_us(), 3000u);
    node_->deactivate();
}
