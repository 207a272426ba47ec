#ifndef BEST_FRAME_SELECTOR_HPP
#define BEST_FRAME_SELECTOR_HPP

#include "vision/frame_scorer.hpp"
#include "vision/frame_source.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

struct CandidateFrame {
    cv::Mat image;
    std::chrono::steady_clock::time_point timestamp{};
    unsigned score = 0;
    std::string text;   // fast OCR snapshot
    size_t index = 0;   // position in the capture window, 1-based
};

struct SelectionResult {
    std::optional<CandidateFrame> selected;
    size_t framesAnalyzed = 0;
    bool cancelled = false;

    // "No text found": no frame scored above zero
    bool empty() const { return !selected.has_value(); }
};

// Runs a bounded capture window over a live feed and keeps the frame with the
// highest textness score. Ties keep the earliest frame.
class BestFrameSelector {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using FrameObserver = std::function<void(const cv::Mat& frame, const CandidateFrame* best)>;
    using StopCheck = std::function<bool()>;

    struct Config {
        double captureWindowSeconds = 10.0;
        int failedReadBackoffMs = 5;
    };

    explicit BestFrameSelector(Config config, NowFn now = &Clock::now);

    SelectionResult select(FrameSource& source, FrameScorer& scorer,
                           const FrameObserver& observer = FrameObserver(),
                           const StopCheck& shouldStop = StopCheck());

    // Strictly greater score replaces the current best
    static bool isBetter(const CandidateFrame& candidate, const CandidateFrame* best);

    const Config& config() const { return config_; }

private:
    Config config_;
    NowFn now_;
};

#endif
