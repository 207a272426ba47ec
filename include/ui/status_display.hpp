#ifndef STATUS_DISPLAY_HPP
#define STATUS_DISPLAY_HPP

#include "session/session_state.hpp"

#include <opencv2/core.hpp>

#include <string>

// Visual status surface driven by the control loop
class StatusDisplay {
public:
    virtual ~StatusDisplay() = default;

    virtual void show(const cv::Mat& frame, SessionState state, const std::string& message) = 0;

    // Pumps the UI for up to waitMs and reports whether quit was requested
    virtual bool pollQuitKey(int waitMs) = 0;

    virtual void close() = 0;
};

#endif
