#ifndef VOICE_ACTIVITY_GATE_HPP
#define VOICE_ACTIVITY_GATE_HPP

#include "audio/audio_window.hpp"

#include <atomic>
#include <deque>
#include <mutex>

class VoiceActivityGate {
public:
    enum class Decision { Speech, Silence };

    struct Config {
        // Amplitude above the noise floor (int16 units) that counts as speech
        float vadThreshold = 2000.0f;

        // Rolling calibration set size, one entry per observed window
        int calibrationWindows = 48;

        // Floor = mean + floorMarginStdDevs * stddev
        float floorMarginStdDevs = 2.0f;

        // Calibration converges once stddev <= maxCalibrationSpread * mean + minCalibrationSpread
        float maxCalibrationSpread = 0.5f;
        float minCalibrationSpread = 50.0f;

        // Consecutive loud buffers needed inside a window
        int speechRunBuffers = 3;
    };

    struct NoiseProfile {
        float floor = 0.0f;
        float mean = 0.0f;
        float stddev = 0.0f;
        int sampleCount = 0;
        bool frozen = false;
    };

    explicit VoiceActivityGate(Config config);

    void observeForCalibration(const AudioWindow& window);
    Decision classify(const AudioWindow& window) const;

    bool isCalibrated() const { return calibrated_.load(std::memory_order_acquire); }
    NoiseProfile noiseProfile() const;

    // Level a buffer peak must exceed to count as speech
    float speechLevel() const;

    const Config& config() const { return config_; }

private:
    Config config_;

    mutable std::mutex mutex_;
    std::deque<float> calibrationPeaks_;
    NoiseProfile profile_;
    std::atomic<bool> calibrated_{false};
};

const char* toString(VoiceActivityGate::Decision decision);

#endif
