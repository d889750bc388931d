#pragma once

#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "xicam_ng/ConfigurableSession.hpp"
#include "xicam_ng/IDriver.hpp"
#include "xicam_ng/Recorder.hpp"
#include "xicam_ng/StreamingSession.hpp"

namespace xicam_ng
{

/**
 * @brief Lifecycle node that drives one camera session and a Recorder.
 *
 * configure opens the camera and applies the ROS parameters,
 * activate starts streaming and recording, deactivate stops both and hands
 * the device back to the configurable session, cleanup closes it.
 *
 * exposure_us and gain_db can be changed at any time: while configured
 * they are written to the camera at once, while active they are queued and
 * the grab thread applies them between two fetches. Other camera parameters
 * are rejected while active and picked up by the next configure otherwise.
 */
class XiCameraNode : public rclcpp_lifecycle::LifecycleNode
{
public:
    explicit XiCameraNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    ~XiCameraNode() override;

    using CallbackReturn =
        rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

    /// Frames fetched since the last activate.
    uint64_t frames_grabbed() const { return frames_grabbed_; }
    /// Exposure reported in the header of the most recent frame.
    uint32_t last_frame_exposure_us() const { return last_exposure_us_; }

protected:
    CallbackReturn on_configure(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_activate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_shutdown(const rclcpp_lifecycle::State &) override;

private:
    // exposure_us / gain_db values waiting for the grab thread.
    struct LiveSettings {
        std::optional<float> exposure_us;
        std::optional<float> gain_db;
    };

    void run_loop();
    LiveSettings take_pending();
    void stop_streaming();
    void apply_parameters(ConfigurableSession& camera);
    std::shared_ptr<IDriver> make_driver(const std::string& backend) const;

    rcl_interfaces::msg::SetParametersResult
    on_parameters(const std::vector<rclcpp::Parameter>& params);

    std::mutex cam_mtx_;
    std::optional<ConfigurableSession> configurable_;
    std::optional<StreamingSession> streaming_;

    std::shared_ptr<Recorder> recorder_;
    rclcpp::node_interfaces::OnSetParametersCallbackHandle::SharedPtr param_cb_;

    std::mutex pending_mtx_;
    LiveSettings pending_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_grabbed_{0};
    std::atomic<uint32_t> last_exposure_us_{0};

    bool wide_pixels_{false};
    uint32_t grab_timeout_ms_{100};
};

}  // namespace xicam_ng
