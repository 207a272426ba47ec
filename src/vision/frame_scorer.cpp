#include "vision/frame_scorer.hpp"
#include "util/log.hpp"

#include <opencv2/imgproc.hpp>

// Constructor
FrameScorer::FrameScorer(FastOcr& ocr) : FrameScorer(ocr, Config{}) {}

FrameScorer::FrameScorer(FastOcr& ocr, Config config) : ocr_(ocr), config_(config) {}

unsigned FrameScorer::score(const cv::Mat& frame) { return scoreWithText(frame).score; }

FrameScorer::Scored FrameScorer::scoreWithText(const cv::Mat& frame) {
    Scored out;
    if (isBlank(frame)) return out;

    TextResult result;
    try {
        result = ocr_.extractText(frame);
    } catch (const std::exception& e) {
        logWarn("Frame Scorer") << "Fast OCR threw: " << e.what();
        return out;
    }

    if (result.status == ResultStatus::Error) {
        logDebug("Frame Scorer") << "Fast OCR failed: " << result.error;
        return out;
    }
    if (!result.hasText()) return out;

    out.score = countWords(result.text);
    out.text = std::move(result.text);
    return out;
}

bool FrameScorer::isBlank(const cv::Mat& frame) const {
    if (frame.empty() || frame.total() == 0) return true;

    cv::Mat gray;
    if (frame.channels() == 1) {
        gray = frame;
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        return true;
    }

    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    return stddev[0] < config_.minContrastStdDev;
}
