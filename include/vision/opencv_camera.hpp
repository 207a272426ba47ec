#ifndef OPENCV_CAMERA_HPP
#define OPENCV_CAMERA_HPP

#include "vision/frame_source.hpp"

#include <opencv2/videoio.hpp>

class OpenCvCamera : public FrameSource {
public:
    struct Config {
        int cameraIndex = 0;
        int width = 1280;
        int height = 720;
    };

    explicit OpenCvCamera(Config config);
    ~OpenCvCamera() override;

    OpenCvCamera(const OpenCvCamera&) = delete;
    OpenCvCamera& operator=(const OpenCvCamera&) = delete;

    // Throws DeviceError when the camera cannot be opened or yields no frames
    void open();

    bool read(cv::Mat& frame) override;
    void release() override;

private:
    bool probeFrame(cv::Mat& frame);

    Config config_;
    cv::VideoCapture cap_;
};

#endif
