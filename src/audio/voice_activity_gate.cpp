#include "audio/voice_activity_gate.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>

// Constructor
VoiceActivityGate::VoiceActivityGate(Config config) : config_(config) {
    config_.calibrationWindows = std::max(1, config_.calibrationWindows);
    config_.speechRunBuffers = std::max(1, config_.speechRunBuffers);
}

// Feeds one ambient window into the rolling noise estimate. No-op once frozen.
void VoiceActivityGate::observeForCalibration(const AudioWindow& window) {
    if (window.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (profile_.frozen) return;

    calibrationPeaks_.push_back(window.peak);
    if ((int)calibrationPeaks_.size() > config_.calibrationWindows) calibrationPeaks_.pop_front();
    profile_.sampleCount++;

    if ((int)calibrationPeaks_.size() < config_.calibrationWindows) return;

    double sum = 0.0;
    for (float p : calibrationPeaks_) sum += p;
    const double mean = sum / (double)calibrationPeaks_.size();

    double var = 0.0;
    for (float p : calibrationPeaks_) var += ((double)p - mean) * ((double)p - mean);
    const double stddev = std::sqrt(var / (double)calibrationPeaks_.size());

    profile_.mean = (float)mean;
    profile_.stddev = (float)stddev;

    // Too much spread means someone was talking; keep rolling.
    const double allowed = (double)config_.maxCalibrationSpread * mean + (double)config_.minCalibrationSpread;
    if (stddev > allowed) return;

    profile_.floor = (float)(mean + (double)config_.floorMarginStdDevs * stddev);
    profile_.frozen = true;
    calibrationPeaks_.clear();
    calibrated_.store(true, std::memory_order_release);

    logInfo("Voice Gate") << "Calibration complete. Noise floor: " << profile_.floor
                          << " (mean " << profile_.mean << ", stddev " << profile_.stddev
                          << ", samples " << profile_.sampleCount << ")";
}

VoiceActivityGate::Decision VoiceActivityGate::classify(const AudioWindow& window) const {
    if (!isCalibrated() || window.bufferPeaks.empty()) return Decision::Silence;

    const float level = speechLevel();
    const int needed = std::min(config_.speechRunBuffers, (int)window.bufferPeaks.size());

    int run = 0;
    for (float p : window.bufferPeaks) {
        if (p > level) {
            if (++run >= needed) return Decision::Speech;
        } else {
            run = 0;
        }
    }
    return Decision::Silence;
}

VoiceActivityGate::NoiseProfile VoiceActivityGate::noiseProfile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_;
}

float VoiceActivityGate::speechLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_.floor + config_.vadThreshold;
}

const char* toString(VoiceActivityGate::Decision decision) {
    return decision == VoiceActivityGate::Decision::Speech ? "speech" : "silence";
}
