#ifndef OPENCV_STATUS_DISPLAY_HPP
#define OPENCV_STATUS_DISPLAY_HPP

#include "ui/status_display.hpp"

#include <string>

// HighGUI window showing the live feed with a status banner; 'q' quits
class OpenCvStatusDisplay : public StatusDisplay {
public:
    explicit OpenCvStatusDisplay(std::string windowName = "Live_Feed");
    ~OpenCvStatusDisplay() override;

    void show(const cv::Mat& frame, SessionState state, const std::string& message) override;
    bool pollQuitKey(int waitMs) override;
    void close() override;

private:
    std::string windowName_;
    bool open_ = false;
};

#endif
