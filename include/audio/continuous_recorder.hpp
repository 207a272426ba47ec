#ifndef CONTINUOUS_RECORDER_HPP
#define CONTINUOUS_RECORDER_HPP

#include "audio/audio_source.hpp"
#include "audio/bandpass_filter.hpp"
#include "audio/voice_activity_gate.hpp"
#include "session/audio_monitor.hpp"
#include "stt/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Samples the microphone on its own thread, cuts fixed-duration windows, gates them
// through the VoiceActivityGate and hands speech windows to a transcription worker.
// Neither thread ever waits on the control loop.
class ContinuousRecorder : public AudioMonitor {
public:
    enum class State { Idle, Calibrating, Ready, Sampling };

    struct Config {
        double recordingIntervalSeconds = 10.0;
        std::string recognitionLanguage = "en";
        BandpassFilter::Config bandpass;

        // Speech windows are never dropped; past this depth a warning is logged
        size_t transcriptionBacklogWarn = 3;

        int readErrorBackoffMs = 100;
    };

    ContinuousRecorder(Config config, AudioSource& source, VoiceActivityGate& gate, Transcriber& transcriber);
    ~ContinuousRecorder() override;

    ContinuousRecorder(const ContinuousRecorder&) = delete;
    ContinuousRecorder& operator=(const ContinuousRecorder&) = delete;

    // Opens the source (DeviceError propagates) and launches both threads
    void start();
    void stop() override;

    State state() const { return state_.load(); }
    bool isCalibrated() const override { return gate_.isCalibrated(); }

    std::optional<TranscriptEvent> pollTranscript() override;
    double secondsUntilNextWindow() const override;

    size_t windowsCaptured() const { return windowsCaptured_.load(); }
    size_t windowsForwarded() const { return windowsForwarded_.load(); }

    // Blocks until the source has ended and every queued speech window is transcribed
    bool waitUntilDrained(std::chrono::milliseconds timeout);

private:
    void samplingLoop();
    void transcriptionLoop();
    void finishWindow(AudioWindow&& window);

    Config config_;
    AudioSource& source_;
    VoiceActivityGate& gate_;
    Transcriber& transcriber_;

    size_t windowSamples_ = 0;
    int sampleRate_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<State> state_{State::Idle};
    std::atomic<size_t> samplesInWindow_{0};
    std::atomic<size_t> windowsCaptured_{0};
    std::atomic<size_t> windowsForwarded_{0};

    std::thread samplingThread_;
    std::thread transcriptionThread_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<AudioWindow> speechQueue_;
    bool samplingDone_ = false;
    bool transcribing_ = false;

    std::mutex transcriptMutex_;
    std::deque<TranscriptEvent> transcripts_;
};

const char* toString(ContinuousRecorder::State state);

#endif
