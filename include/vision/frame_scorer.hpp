#ifndef FRAME_SCORER_HPP
#define FRAME_SCORER_HPP

#include "ocr/ocr_engine.hpp"

#include <opencv2/core.hpp>

#include <string>

// Textness score of a single frame: word count from the fast OCR pass.
// Never fails; a blank frame or an engine error scores 0.
class FrameScorer {
public:
    struct Config {
        // Frames whose grayscale stddev is below this are treated as blank
        double minContrastStdDev = 2.0;
    };

    struct Scored {
        unsigned score = 0;
        std::string text;
    };

    explicit FrameScorer(FastOcr& ocr);
    FrameScorer(FastOcr& ocr, Config config);

    unsigned score(const cv::Mat& frame);
    Scored scoreWithText(const cv::Mat& frame);

    bool isBlank(const cv::Mat& frame) const;

private:
    FastOcr& ocr_;
    Config config_;
};

#endif
