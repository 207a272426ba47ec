#include "vision/best_frame_selector.hpp"
#include "util/log.hpp"

#include <thread>
#include <utility>

// Constructor
BestFrameSelector::BestFrameSelector(Config config, NowFn now) : config_(config), now_(std::move(now)) {
    if (!now_) now_ = &Clock::now;
}

bool BestFrameSelector::isBetter(const CandidateFrame& candidate, const CandidateFrame* best) {
    if (candidate.score == 0) return false;
    return !best || candidate.score > best->score;
}

SelectionResult BestFrameSelector::select(FrameSource& source, FrameScorer& scorer, const FrameObserver& observer,
                                          const StopCheck& shouldStop) {
    SelectionResult result;

    const auto window = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(config_.captureWindowSeconds));
    const Clock::time_point start = now_();

    logInfo("Frame Selector") << "Capturing frames for " << config_.captureWindowSeconds
                              << " seconds to find text...";

    cv::Mat frame;
    while (now_() - start < window) {
        if (shouldStop && shouldStop()) {
            result.cancelled = true;
            break;
        }

        if (!source.read(frame)) {
            if (config_.failedReadBackoffMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.failedReadBackoffMs));
            }
            continue;
        }

        CandidateFrame candidate;
        candidate.timestamp = now_();
        candidate.index = ++result.framesAnalyzed;

        FrameScorer::Scored scored = scorer.scoreWithText(frame);
        candidate.score = scored.score;

        const CandidateFrame* best = result.selected ? &*result.selected : nullptr;
        if (isBetter(candidate, best)) {
            candidate.image = frame.clone();
            candidate.text = std::move(scored.text);
            logInfo("Frame Selector") << "Frame " << candidate.index << ": Found " << candidate.score
                                      << " words - New best frame!";
            result.selected = std::move(candidate);
        }

        if (observer) observer(frame, result.selected ? &*result.selected : nullptr);
    }

    if (result.cancelled) {
        logInfo("Frame Selector") << "Capture cancelled after " << result.framesAnalyzed << " frames";
    } else if (result.empty()) {
        logInfo("Frame Selector") << "No text found in " << result.framesAnalyzed << " frames";
    } else {
        logInfo("Frame Selector") << "Best frame found with " << result.selected->score << " words ("
                                  << result.framesAnalyzed << " frames analyzed)";
    }
    return result;
}
