#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include <opencv2/core.hpp>

// Live video feed. read() returns false when no frame could be grabbed this time.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

#endif
