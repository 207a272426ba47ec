#include "vision/opencv_camera.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

#include <chrono>
#include <string>
#include <thread>

// Constructor
OpenCvCamera::OpenCvCamera(Config config) : config_(config) {}

// Destructor
OpenCvCamera::~OpenCvCamera() { release(); }

void OpenCvCamera::open() {
    if (cap_.isOpened()) return;

    if (!cap_.open(config_.cameraIndex)) {
        throw DeviceError("Could not open camera index " + std::to_string(config_.cameraIndex));
    }

    cv::Mat probe;
    if (!probeFrame(probe)) {
        cap_.release();
        throw DeviceError("Camera opened but no frames: index " + std::to_string(config_.cameraIndex));
    }

    cap_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);

    // Some drivers reject the resolution change silently; keep whatever they settle on
    if (!cap_.read(probe) || probe.empty()) {
        cap_.release();
        throw DeviceError("Camera stream failed after resolution change: index " +
                          std::to_string(config_.cameraIndex));
    }

    logInfo("Camera") << "Camera initialized: " << probe.cols << "x" << probe.rows
                      << " (index " << config_.cameraIndex << ")";
}

// A freshly opened camera often returns a few empty frames
bool OpenCvCamera::probeFrame(cv::Mat& frame) {
    for (int i = 0; i < 4; ++i) {
        if (cap_.read(frame) && !frame.empty()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

bool OpenCvCamera::read(cv::Mat& frame) {
    if (!cap_.isOpened()) return false;
    return cap_.read(frame) && !frame.empty();
}

void OpenCvCamera::release() {
    if (cap_.isOpened()) {
        cap_.release();
        logInfo("Camera") << "Camera released";
    }
}
