#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include "audio/audio_player.hpp"
#include "ocr/ocr_engine.hpp"
#include "session/audio_monitor.hpp"
#include "session/session_state.hpp"
#include "trigger/trigger_detector.hpp"
#include "tts/speech_synthesizer.hpp"
#include "ui/status_display.hpp"
#include "vision/best_frame_selector.hpp"
#include "vision/frame_scorer.hpp"
#include "vision/frame_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

// Foreground control loop: Calibrating -> Monitoring -> Capturing -> Speaking -> Monitoring,
// with Shutdown reachable from every state once quit is requested.
class SessionController {
public:
    struct Config {
        int calibratingTickMs = 100;
        int monitoringTickMs = 30;
        double statusRefreshSeconds = 5.0;

        // Consecutive failed camera reads before the camera is considered lost
        int maxFailedReads = 50;
    };

    // Collaborators are borrowed; they must outlive the controller
    struct Services {
        AudioMonitor& monitor;
        FrameSource& camera;
        StatusDisplay& display;
        TriggerDetector& trigger;
        FrameScorer& scorer;
        BestFrameSelector& selector;
        AccurateOcr& accurateOcr;
        SpeechSynthesizer& synthesizer;
        AudioPlayer& player;
    };

    SessionController(Config config, Services services);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Runs ticks until Shutdown; returns the process exit code
    int run();

    // One iteration of the current state
    SessionState tick();

    // Safe from any thread or a signal handler
    void requestShutdown() { quitRequested_.store(true); }
    bool shutdownRequested() const { return quitRequested_.load(); }

    SessionState state() const { return state_.load(); }

    size_t capturesRun() const { return capturesRun_; }
    size_t utterancesSpoken() const { return utterancesSpoken_; }

private:
    void enterState(SessionState next);

    void tickCalibrating();
    void tickMonitoring();
    void tickCapturing();
    void tickSpeaking();
    void shutdown();

    bool grabFrame();
    void pollQuit(int waitMs);

    Config config_;
    Services services_;

    std::atomic<SessionState> state_{SessionState::Calibrating};
    std::atomic<bool> quitRequested_{false};

    cv::Mat frame_;
    int failedReads_ = 0;
    int exitCode_ = 0;

    std::string statusMessage_;
    std::chrono::steady_clock::time_point lastStatusUpdate_{};
    std::string pendingText_;

    size_t capturesRun_ = 0;
    size_t utterancesSpoken_ = 0;
};

#endif
