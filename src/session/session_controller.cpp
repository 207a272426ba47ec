#include "session/session_controller.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

// Constructor
SessionController::SessionController(Config config, Services services)
    : config_(config), services_(services) {}

// Destructor
SessionController::~SessionController() {
    if (state_.load() != SessionState::Shutdown) shutdown();
}

int SessionController::run() {
    logInfo("Session") << "System initializing. Please wait for noise calibration...";

    while (state_.load() != SessionState::Shutdown) tick();
    return exitCode_;
}

SessionState SessionController::tick() {
    if (quitRequested_.load() && state_.load() != SessionState::Shutdown) {
        logInfo("Session") << "Quit command received";
        shutdown();
        return state_.load();
    }

    switch (state_.load()) {
        case SessionState::Calibrating: tickCalibrating(); break;
        case SessionState::Monitoring:  tickMonitoring(); break;
        case SessionState::Capturing:   tickCapturing(); break;
        case SessionState::Speaking:    tickSpeaking(); break;
        case SessionState::Shutdown:    break;
    }
    return state_.load();
}

void SessionController::enterState(SessionState next) {
    const SessionState prev = state_.exchange(next);
    if (prev == next) return;

    logDebug("Session") << toString(prev) << " -> " << toString(next);
    if (next == SessionState::Monitoring) lastStatusUpdate_ = std::chrono::steady_clock::time_point{};
}

// Reads into frame_; after maxFailedReads misses in a row the camera is treated as lost
bool SessionController::grabFrame() {
    if (services_.camera.read(frame_)) {
        failedReads_ = 0;
        return true;
    }

    if (++failedReads_ >= config_.maxFailedReads) {
        logError("Session") << "Failed to grab frame " << failedReads_ << " times, camera lost";
        exitCode_ = 1;
        requestShutdown();
    }
    return false;
}

void SessionController::pollQuit(int waitMs) {
    if (services_.display.pollQuitKey(waitMs)) requestShutdown();
}

void SessionController::tickCalibrating() {
    if (grabFrame()) services_.display.show(frame_, SessionState::Calibrating, "Calibrating noise...");
    pollQuit(config_.calibratingTickMs);

    if (services_.monitor.isCalibrated()) {
        logInfo("Session") << "System ready! Say 'What is written here' to trigger OCR. Press 'q' to quit.";
        enterState(SessionState::Monitoring);
    }
}

void SessionController::tickMonitoring() {
    const auto now = std::chrono::steady_clock::now();
    if (statusMessage_.empty() ||
        now - lastStatusUpdate_ > std::chrono::duration<double>(config_.statusRefreshSeconds)) {
        const double remaining = std::max(0.0, services_.monitor.secondsUntilNextWindow());
        statusMessage_ = "Next recording in: " + std::to_string((int)std::ceil(remaining)) + "s";
        lastStatusUpdate_ = now;
    }

    if (grabFrame()) services_.display.show(frame_, SessionState::Monitoring, statusMessage_);

    if (std::optional<TranscriptEvent> event = services_.monitor.pollTranscript()) {
        if (event->status == ResultStatus::Error) {
            logDebug("Session") << "Ignoring failed transcription: " << event->error;
        } else if (event->hasText() && services_.trigger.matches(event->text)) {
            logInfo("Session") << "OCR request detected!";
            enterState(SessionState::Capturing);
            return;
        }
    }

    pollQuit(config_.monitoringTickMs);
}

void SessionController::tickCapturing() {
    capturesRun_++;

    auto observer = [this](const cv::Mat& frame, const CandidateFrame* best) {
        std::string message = "Searching for text...";
        if (best) message += " (" + std::to_string(best->score) + " words)";
        services_.display.show(frame, SessionState::Capturing, message);
        pollQuit(1);
    };
    auto shouldStop = [this] { return quitRequested_.load(); };

    SelectionResult selection = services_.selector.select(services_.camera, services_.scorer, observer, shouldStop);
    if (selection.cancelled) return;

    if (selection.empty()) {
        logInfo("Session") << "No text detected, back to monitoring";
        enterState(SessionState::Monitoring);
        return;
    }

    TextResult ocr;
    try {
        ocr = services_.accurateOcr.extract(selection.selected->image);
    } catch (const std::exception& e) {
        ocr = TextResult::failure(e.what());
    }

    if (ocr.status == ResultStatus::Error) {
        logWarn("Session") << "Error in heavy OCR processing: " << ocr.error;
        enterState(SessionState::Monitoring);
        return;
    }
    if (!ocr.hasText()) {
        logInfo("Session") << "No text detected in the selected frame";
        enterState(SessionState::Monitoring);
        return;
    }

    logInfo("Session") << "OCR Result: " << ocr.text;
    pendingText_ = std::move(ocr.text);
    enterState(SessionState::Speaking);
}

void SessionController::tickSpeaking() {
    if (grabFrame()) services_.display.show(frame_, SessionState::Speaking, "Reading text aloud...");
    pollQuit(1);

    SpokenUtterance utterance;
    utterance.text = std::move(pendingText_);
    pendingText_.clear();

    if (!quitRequested_.load()) {
        SynthesisResult synth;
        try {
            synth = services_.synthesizer.synthesize(utterance.text);
        } catch (const std::exception& e) {
            synth = SynthesisResult::failure(e.what());
        }

        if (synth.status != ResultStatus::Ok) {
            logWarn("Session") << "Speech synthesis failed: "
                               << (synth.error.empty() ? "no audio" : synth.error);
        } else {
            utterance.artifact = std::move(synth.artifact);

            PlaybackResult playback;
            try {
                playback = services_.player.play(utterance.artifact, [this] {
                    pollQuit(1);
                    return quitRequested_.load();
                });
            } catch (const std::exception& e) {
                playback = PlaybackResult::failure(e.what());
            }

            if (!playback.ok()) {
                logWarn("Session") << "Error playing audio: " << playback.error;
            } else if (!playback.cancelled) {
                utterancesSpoken_++;
            }
        }
    }

    // Artifact goes now, whatever playback did
    utterance.artifact.release();
    enterState(SessionState::Monitoring);
}

void SessionController::shutdown() {
    logInfo("Session") << "Cleaning up resources...";
    state_.store(SessionState::Shutdown);

    services_.monitor.stop();
    services_.camera.release();
    services_.display.close();

    logInfo("Session") << "System shutdown complete";
}
