#include "audio/continuous_recorder.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

// Constructor
ContinuousRecorder::ContinuousRecorder(Config config, AudioSource& source, VoiceActivityGate& gate,
                                       Transcriber& transcriber)
    : config_(std::move(config)), source_(source), gate_(gate), transcriber_(transcriber) {}

// Destructor
ContinuousRecorder::~ContinuousRecorder() { stop(); }

// Opens the microphone and starts the sampling and transcription threads
void ContinuousRecorder::start() {
    if (running_.load()) return;

    source_.open();

    sampleRate_ = source_.sampleRate();
    windowSamples_ = (size_t)std::max(1L, std::lround(config_.recordingIntervalSeconds * sampleRate_));
    samplesInWindow_ = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        samplingDone_ = false;
    }

    state_ = gate_.isCalibrated() ? State::Ready : State::Calibrating;
    if (state_ == State::Calibrating) {
        logInfo("Audio Recorder") << "Calibrating noise floor, please remain silent...";
    }

    running_ = true;
    transcriptionThread_ = std::thread(&ContinuousRecorder::transcriptionLoop, this);
    samplingThread_ = std::thread(&ContinuousRecorder::samplingLoop, this);
}

// Stops both threads and closes the microphone
void ContinuousRecorder::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
    }
    queueCv_.notify_all();
    if (samplingThread_.joinable()) samplingThread_.join();
    if (transcriptionThread_.joinable()) transcriptionThread_.join();

    source_.close();
    state_ = State::Idle;
    logInfo("Audio Recorder") << "Stopped after " << windowsCaptured_.load() << " windows ("
                              << windowsForwarded_.load() << " forwarded)";
}

std::optional<TranscriptEvent> ContinuousRecorder::pollTranscript() {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    if (transcripts_.empty()) return std::nullopt;

    TranscriptEvent event = std::move(transcripts_.front());
    transcripts_.pop_front();
    return event;
}

double ContinuousRecorder::secondsUntilNextWindow() const {
    if (sampleRate_ <= 0 || !gate_.isCalibrated()) return config_.recordingIntervalSeconds;

    const size_t filled = std::min(samplesInWindow_.load(), windowSamples_);
    return (double)(windowSamples_ - filled) / (double)sampleRate_;
}

bool ContinuousRecorder::waitUntilDrained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return queueCv_.wait_for(lock, timeout, [&] {
        return samplingDone_ && speechQueue_.empty() && !transcribing_;
    });
}

// Thread function reading the device. Calibration buffers go to the gate one at a time,
// afterwards buffers are accumulated into windows of recordingIntervalSeconds.
void ContinuousRecorder::samplingLoop() {
    BandpassFilter filter(sampleRate_, config_.bandpass);
    std::vector<int16_t> buffer;

    AudioWindow window;
    window.sampleRate = sampleRate_;

    while (running_.load()) {
        const AudioSource::ReadStatus status = source_.read(buffer);

        if (status == AudioSource::ReadStatus::EndOfStream) {
            logInfo("Audio Recorder") << "Audio source ended";
            break;
        }
        if (status == AudioSource::ReadStatus::Overflow) {
            logDebug("Audio Recorder") << "Input overflow, buffer skipped";
            continue;
        }
        if (status == AudioSource::ReadStatus::Error) {
            logWarn("Audio Recorder") << "Stream read error (non-fatal), retrying";
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.readErrorBackoffMs));
            continue;
        }
        if (buffer.empty()) continue;

        if (!gate_.isCalibrated()) {
            const float bandPeak = filter.processPeak(buffer.data(), (int)buffer.size());
            AudioWindow ambient;
            ambient.sampleRate = sampleRate_;
            ambient.append(buffer.data(), (int)buffer.size(), bandPeak);
            gate_.observeForCalibration(ambient);

            if (gate_.isCalibrated()) {
                state_ = State::Ready;
                samplesInWindow_ = 0;
                logInfo("Audio Recorder") << "Ready, recording every "
                                          << config_.recordingIntervalSeconds << "s";
            }
            continue;
        }

        state_ = State::Sampling;

        // A device buffer may straddle the window boundary; each piece gets its own peak.
        // The filter state carries over between pieces.
        size_t offset = 0;
        while (offset < buffer.size()) {
            const size_t room = windowSamples_ - window.samples.size();
            const size_t take = std::min(room, buffer.size() - offset);
            const float bandPeak = filter.processPeak(buffer.data() + offset, (int)take);
            window.append(buffer.data() + offset, (int)take, bandPeak);
            offset += take;
            samplesInWindow_ = window.samples.size();

            if (window.samples.size() >= windowSamples_) {
                finishWindow(std::move(window));
                window = AudioWindow();
                window.sampleRate = sampleRate_;
                samplesInWindow_ = 0;
                state_ = State::Ready;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        samplingDone_ = true;
    }
    queueCv_.notify_all();
}

// Classifies a completed window; silence is dropped, speech is queued for transcription
void ContinuousRecorder::finishWindow(AudioWindow&& window) {
    windowsCaptured_++;

    const VoiceActivityGate::Decision decision = gate_.classify(window);
    if (decision == VoiceActivityGate::Decision::Silence) {
        logDebug("Audio Recorder") << "Window " << windowsCaptured_.load() << " silent (peak "
                                   << window.peak << "), dropped";
        return;
    }

    logInfo("Audio Recorder") << "Speech detected: peak " << window.peak << " > "
                              << gate_.speechLevel();

    size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        speechQueue_.push_back(std::move(window));
        depth = speechQueue_.size();
    }
    windowsForwarded_++;
    queueCv_.notify_all();

    if (depth > config_.transcriptionBacklogWarn) {
        logWarn("Audio Recorder") << "Transcription backlog at " << depth << " windows";
    }
}

// Thread function draining the speech queue into the transcript mailbox
void ContinuousRecorder::transcriptionLoop() {
    for (;;) {
        AudioWindow window;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [&] { return !running_.load() || !speechQueue_.empty(); });
            if (!running_.load()) break;

            window = std::move(speechQueue_.front());
            speechQueue_.pop_front();
            transcribing_ = true;
        }

        TextResult result;
        try {
            result = transcriber_.transcribe(window, config_.recognitionLanguage);
        } catch (const std::exception& e) {
            result = TextResult::failure(e.what());
        }

        TranscriptEvent event;
        event.text = result.text;
        event.status = result.status;
        event.error = result.error;
        event.windowStart = window.startTime;

        if (result.status == ResultStatus::Error) {
            logWarn("Audio Recorder") << "Transcription failed: " << result.error;
        } else {
            logInfo("Audio Recorder") << "Transcription: " << (event.text.empty() ? "(none)" : event.text);
        }

        {
            std::lock_guard<std::mutex> lock(transcriptMutex_);
            transcripts_.push_back(std::move(event));
        }
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            transcribing_ = false;
        }
        queueCv_.notify_all();
    }
}

const char* toString(ContinuousRecorder::State state) {
    switch (state) {
        case ContinuousRecorder::State::Idle:        return "idle";
        case ContinuousRecorder::State::Calibrating: return "calibrating";
        case ContinuousRecorder::State::Ready:       return "ready";
        case ContinuousRecorder::State::Sampling:    return "sampling";
    }
    return "unknown";
}
