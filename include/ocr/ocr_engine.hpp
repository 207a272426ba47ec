#ifndef OCR_ENGINE_HPP
#define OCR_ENGINE_HPP

#include "core/service_result.hpp"

#include <opencv2/core.hpp>

#include <string>

// Cheap, low-accuracy pass used once per captured frame
class FastOcr {
public:
    virtual ~FastOcr() = default;

    // Must not throw; malformed input gives an empty or error result
    virtual TextResult extractText(const cv::Mat& image) = 0;

    // Word count of extractText(); 0 on any failure
    unsigned extractWords(const cv::Mat& image);
};

// Slow, high-accuracy pass run once on the selected frame
class AccurateOcr {
public:
    virtual ~AccurateOcr() = default;

    virtual TextResult extract(const cv::Mat& image) = 0;
};

// Undoes a detected clockwise rotation of 90, 180 or 270 degrees; any other angle returns the image as is
cv::Mat uprightImage(const cv::Mat& image, int clockwiseDegrees);

// Number of runs of [A-Za-z0-9_] (non-ASCII bytes count as word characters)
unsigned countWords(const std::string& text);

#endif
