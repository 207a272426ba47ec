#include "ui/opencv_status_display.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <utility>

namespace {

cv::Scalar bannerColor(SessionState state) {
    switch (state) {
        case SessionState::Calibrating: return cv::Scalar(0, 0, 255);
        case SessionState::Capturing:   return cv::Scalar(0, 255, 0);
        case SessionState::Speaking:    return cv::Scalar(255, 200, 0);
        default:                        return cv::Scalar(0, 255, 0);
    }
}

} // namespace

// Constructor
OpenCvStatusDisplay::OpenCvStatusDisplay(std::string windowName) : windowName_(std::move(windowName)) {}

// Destructor
OpenCvStatusDisplay::~OpenCvStatusDisplay() { close(); }

void OpenCvStatusDisplay::show(const cv::Mat& frame, SessionState state, const std::string& message) {
    if (frame.empty()) return;

    cv::Mat info = frame.clone();
    const double scale = std::max(0.6, info.cols / 1280.0);
    const int thickness = std::max(1, (int)(2 * scale));

    cv::putText(info, message, cv::Point(10, (int)(35 * scale)), cv::FONT_HERSHEY_SIMPLEX, 0.8 * scale,
                bannerColor(state), thickness);
    cv::putText(info, toString(state), cv::Point(10, info.rows - (int)(15 * scale)), cv::FONT_HERSHEY_SIMPLEX,
                0.5 * scale, cv::Scalar(200, 200, 200), std::max(1, thickness - 1));

    cv::imshow(windowName_, info);
    open_ = true;
}

bool OpenCvStatusDisplay::pollQuitKey(int waitMs) {
    const int key = cv::waitKey(std::max(1, waitMs));
    return key == 'q' || key == 'Q';
}

void OpenCvStatusDisplay::close() {
    if (!open_) return;
    cv::destroyWindow(windowName_);
    open_ = false;
}
