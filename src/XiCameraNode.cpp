#include "xicam_ng/XiCameraNode.hpp"

#include "xicam_ng/Device.hpp"
#include "xicam_ng/FakeDriver.hpp"
#include "xicam_ng/XiApiDriver.hpp"
#include "xicam_ng/XiError.hpp"

#include <chrono>
#include <map>
#include <stdexcept>

namespace xicam_ng
{

namespace {

const std::map<std::string, XI_IMG_FORMAT> kFormats = {
    {"mono8", XI_MONO8},   {"mono16", XI_MONO16},
    {"raw8", XI_RAW8},     {"raw16", XI_RAW16},
    {"rgb24", XI_RGB24},   {"rgb32", XI_RGB32},
};

bool is_live(const std::string& name)
{
    return name == "exposure_us" || name == "gain_db";
}

void write_exposure(StreamingSession& s, float us) { s.set_exposure(us); }
void write_exposure(ConfigurableSession& s, float us) { s.set(prm::exposure, us); }
void write_gain(StreamingSession& s, float db) { s.set_gain(db); }
void write_gain(ConfigurableSession& s, float db) { s.set(prm::gain, db); }

template <typename Session, typename Settings>
void write_live(Session& session, const Settings& live)
{
    if (live.exposure_us) write_exposure(session, *live.exposure_us);
    if (live.gain_db) write_gain(session, *live.gain_db);
}

}  // namespace

XiCameraNode::XiCameraNode(const rclcpp::NodeOptions& options)
    : rclcpp_lifecycle::LifecycleNode("xicam_ng", options)
{
    declare_parameter<std::string>("backend", "xiapi");
    declare_parameter<int>("device_index", 0);
    declare_parameter<int>("bandwidth_limit_mbps", 0);   // 0 = automatic
    declare_parameter<double>("exposure_us", 10000.0);
    declare_parameter<double>("gain_db", 0.0);
    declare_parameter<int>("roi_offset_x", 0);
    declare_parameter<int>("roi_offset_y", 0);
    declare_parameter<int>("roi_width", 0);              // 0 = leave as is
    declare_parameter<int>("roi_height", 0);
    declare_parameter<std::string>("image_format", "mono8");
    declare_parameter<int>("fps", 30);
    declare_parameter<std::string>("output_path", "/tmp/xicam_ng.mp4");
    declare_parameter<std::string>("codec", "libx264");
    declare_parameter<int>("pool_size", 16);
    declare_parameter<int>("grab_timeout_ms", 100);

    param_cb_ = add_on_set_parameters_callback(
        [this](const std::vector<rclcpp::Parameter>& params) { return on_parameters(params); });
}

XiCameraNode::~XiCameraNode()
{
    stop_streaming();
}

std::shared_ptr<IDriver> XiCameraNode::make_driver(const std::string& backend) const
{
    if (backend == "xiapi") return default_driver();
    if (backend == "fake") return std::make_shared<FakeDriver>();
    throw std::invalid_argument("unknown backend '" + backend + "' (expected xiapi or fake)");
}

void XiCameraNode::apply_parameters(ConfigurableSession& camera)
{
    const auto fmt = kFormats.find(get_parameter("image_format").as_string());
    if (fmt == kFormats.end())
        throw std::invalid_argument("unknown image_format " + get_parameter("image_format").as_string());
    camera.set(prm::image_data_format, fmt->second);
    wide_pixels_ = element_size(fmt->second) == 2;

    camera.set(prm::exposure, static_cast<float>(get_parameter("exposure_us").as_double()));
    camera.set(prm::gain, static_cast<float>(get_parameter("gain_db").as_double()));

    const Roi current = camera.roi();
    Roi wanted = current;
    if (get_parameter("roi_width").as_int() > 0) {
        wanted.width    = static_cast<uint32_t>(get_parameter("roi_width").as_int());
        wanted.offset_x = static_cast<uint32_t>(get_parameter("roi_offset_x").as_int());
    }
    if (get_parameter("roi_height").as_int() > 0) {
        wanted.height   = static_cast<uint32_t>(get_parameter("roi_height").as_int());
        wanted.offset_y = static_cast<uint32_t>(get_parameter("roi_offset_y").as_int());
    }
    if (wanted != current) {
        const Roi applied = camera.set_roi(wanted);
        RCLCPP_INFO(get_logger(), "ROI %ux%u @ (%u,%u)",
                    applied.width, applied.height, applied.offset_x, applied.offset_y);
    }

    try {
        camera.set(prm::acq_timing_mode, XI_ACQ_TIMING_MODE_FRAME_RATE);
        camera.set(prm::framerate, static_cast<float>(get_parameter("fps").as_int()));
    } catch (const XiError& e) {
        if (!e.is_not_supported()) throw;
        RCLCPP_WARN(get_logger(), "Camera runs free: frame rate control not supported (%s)", e.what());
    }
}

XiCameraNode::CallbackReturn
XiCameraNode::on_configure(const rclcpp_lifecycle::State &)
{
    const std::string backend = get_parameter("backend").as_string();
    const auto index = static_cast<uint32_t>(get_parameter("device_index").as_int());
    const int bandwidth = static_cast<int>(get_parameter("bandwidth_limit_mbps").as_int());

    try {
        auto driver = make_driver(backend);
        const uint32_t found = number_devices(driver);
        RCLCPP_INFO(get_logger(), "%s backend sees %u camera(s)", backend.c_str(), found);

        ConfigurableSession camera = bandwidth > 0
            ? open_device_manual_bandwidth(index, bandwidth, driver)
            : open_device(index, driver);
        apply_parameters(camera);

        RCLCPP_INFO(get_logger(), "Configured %s (SN %s) on %s backend",
                    camera.device_name().c_str(), camera.device_serial().c_str(), backend.c_str());

        std::lock_guard<std::mutex> lock(cam_mtx_);
        configurable_.emplace(std::move(camera));
        return CallbackReturn::SUCCESS;
    } catch (const std::exception& e) {
        RCLCPP_ERROR(get_logger(), "Camera configure failed: %s", e.what());
        return CallbackReturn::FAILURE;
    }
}

XiCameraNode::CallbackReturn
XiCameraNode::on_activate(const rclcpp_lifecycle::State &)
{
    std::lock_guard<std::mutex> lock(cam_mtx_);
    if (!configurable_) {
        RCLCPP_ERROR(get_logger(), "Camera not configured.");
        return CallbackReturn::FAILURE;
    }

    const std::string output_path = get_parameter("output_path").as_string();
    grab_timeout_ms_ = static_cast<uint32_t>(get_parameter("grab_timeout_ms").as_int());

    try {
        const Roi roi = configurable_->roi();
        const XI_IMG_FORMAT format = configurable_->get(prm::image_data_format);

        recorder_ = std::make_shared<Recorder>();
        if (!recorder_->start(output_path, roi.width, roi.height,
                              static_cast<int>(get_parameter("fps").as_int()), format,
                              get_parameter("codec").as_string(),
                              static_cast<size_t>(get_parameter("pool_size").as_int()))) {
            recorder_.reset();
            return CallbackReturn::FAILURE;
        }

        // A failed start leaves configurable_ untouched.
        streaming_.emplace(std::move(*configurable_).start());
        configurable_.reset();
    } catch (const XiError& e) {
        RCLCPP_ERROR(get_logger(), "Start failed: %s", e.what());
        if (recorder_) recorder_->stop();
        recorder_.reset();
        return CallbackReturn::FAILURE;
    }

    frames_grabbed_ = 0;
    last_exposure_us_ = 0;
    running_ = true;
    worker_ = std::thread(&XiCameraNode::run_loop, this);

    RCLCPP_INFO(get_logger(), "Camera active and recording to %s", output_path.c_str());
    return CallbackReturn::SUCCESS;
}

void XiCameraNode::stop_streaming()
{
    running_ = false;
    if (worker_.joinable()) worker_.join();

    if (recorder_) {
        recorder_->stop();
        recorder_.reset();
    }

    std::lock_guard<std::mutex> lock(cam_mtx_);
    if (!streaming_) return;
    try {
        configurable_.emplace(std::move(*streaming_).stop());
    } catch (const XiError& e) {
        // The session destructor still tries to stop before closing.
        RCLCPP_ERROR(get_logger(), "Stop failed, closing camera: %s", e.what());
    }
    streaming_.reset();

    // Values queued after the last fetch.
    const LiveSettings leftover = take_pending();
    if (!configurable_) return;
    try {
        write_live(*configurable_, leftover);
    } catch (const XiError& e) {
        RCLCPP_ERROR(get_logger(), "Queued exposure/gain rejected: %s", e.what());
    }
}

XiCameraNode::LiveSettings XiCameraNode::take_pending()
{
    std::lock_guard<std::mutex> lock(pending_mtx_);
    LiveSettings taken = pending_;
    pending_ = LiveSettings{};
    return taken;
}

XiCameraNode::CallbackReturn
XiCameraNode::on_deactivate(const rclcpp_lifecycle::State &)
{
    stop_streaming();
    RCLCPP_INFO(get_logger(), "Camera deactivated and recording stopped.");
    std::lock_guard<std::mutex> lock(cam_mtx_);
    return configurable_ ? CallbackReturn::SUCCESS : CallbackReturn::FAILURE;
}

XiCameraNode::CallbackReturn
XiCameraNode::on_cleanup(const rclcpp_lifecycle::State &)
{
    std::lock_guard<std::mutex> lock(cam_mtx_);
    configurable_.reset();
    RCLCPP_INFO(get_logger(), "Camera closed.");
    return CallbackReturn::SUCCESS;
}

XiCameraNode::CallbackReturn
XiCameraNode::on_shutdown(const rclcpp_lifecycle::State &)
{
    stop_streaming();
    std::lock_guard<std::mutex> lock(cam_mtx_);
    configurable_.reset();
    return CallbackReturn::SUCCESS;
}

rcl_interfaces::msg::SetParametersResult
XiCameraNode::on_parameters(const std::vector<rclcpp::Parameter>& params)
{
    rcl_interfaces::msg::SetParametersResult result;
    result.successful = true;

    std::lock_guard<std::mutex> lock(cam_mtx_);
    if (streaming_) {
        for (const auto& p : params) {
            if (!is_live(p.get_name())) {
                result.successful = false;
                result.reason = p.get_name() + " cannot change while streaming";
                return result;
            }
        }
    }

    LiveSettings live;
    for (const auto& p : params) {
        if (p.get_name() == "exposure_us")
            live.exposure_us = static_cast<float>(p.as_double());
        else if (p.get_name() == "gain_db")
            live.gain_db = static_cast<float>(p.as_double());
    }
    if (!live.exposure_us && !live.gain_db) return result;

    if (streaming_) {
        // The grab thread owns the streaming session; it applies these between fetches.
        std::lock_guard<std::mutex> pending_lock(pending_mtx_);
        if (live.exposure_us) pending_.exposure_us = live.exposure_us;
        if (live.gain_db) pending_.gain_db = live.gain_db;
        return result;
    }
    if (!configurable_) return result;   // picked up by the next configure

    try {
        write_live(*configurable_, live);
        for (const auto& p : params)
            if (is_live(p.get_name()))
                RCLCPP_INFO(get_logger(), "%s -> %s", p.get_name().c_str(), p.value_to_string().c_str());
    } catch (const XiError& e) {
        result.successful = false;
        result.reason = e.what();
    }
    return result;
}

void XiCameraNode::run_loop()
{
    size_t frame_count = 0;
    auto last_heartbeat = std::chrono::steady_clock::now();

    auto record = [&](const auto& view) {
        frame_count++;
        frames_grabbed_++;
        last_exposure_us_ = view.exposure_time_us();
        recorder_->push(view);
        RCLCPP_INFO_THROTTLE(get_logger(), *get_clock(), 2000,
                             "Frame %u ts: %lu us (%ux%u, %u bytes)",
                             view.nframe(), static_cast<unsigned long>(view.timestamp_us()),
                             view.width(), view.height(), view.byte_size());
    };

    // streaming_ belongs to this thread until stop_streaming() has joined it.
    while (running_ && rclcpp::ok()) {
        const LiveSettings live = take_pending();
        try {
            write_live(*streaming_, live);
            if (live.exposure_us)
                RCLCPP_INFO(get_logger(), "exposure_us -> %.1f", *live.exposure_us);
            if (live.gain_db)
                RCLCPP_INFO(get_logger(), "gain_db -> %.2f", *live.gain_db);
        } catch (const XiError& e) {
            RCLCPP_ERROR(get_logger(), "Live exposure/gain rejected: %s", e.what());
        }

        try {
            if (wide_pixels_)
                record(streaming_->next_image<uint16_t>(grab_timeout_ms_));
            else
                record(streaming_->next_image<uint8_t>(grab_timeout_ms_));
        } catch (const XiError& e) {
            if (!e.is_timeout()) {
                RCLCPP_ERROR(get_logger(), "Grab failed, stopping grab loop: %s", e.what());
                break;
            }
        }

        // --- Heartbeat: print FPS every second ---
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_heartbeat).count();
        if (elapsed >= 1.0) {
            double fps_est = frame_count / elapsed;
            RCLCPP_INFO(get_logger(), "Heartbeat: %.2f fps (%.0f frames in %.2fs, %lu dropped)",
                        fps_est, (double)frame_count, elapsed,
                        static_cast<unsigned long>(recorder_->dropped()));
            frame_count = 0;
            last_heartbeat = now;
        }
    }
}

}  // namespace xicam_ng
