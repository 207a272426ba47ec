#include "audio/audio_window.hpp"

#include <algorithm>
#include <cmath>

void AudioWindow::append(const int16_t* data, int frames, float bandPeak) {
    if (frames <= 0) return;
    if (samples.empty()) startTime = Clock::now();

    samples.insert(samples.end(), data, data + frames);
    bufferPeaks.push_back(bandPeak);
    peak = std::max(peak, bandPeak);

    for (int i = 0; i < frames; ++i) sumSquares_ += (double)data[i] * (double)data[i];
    rms = (float)std::sqrt(sumSquares_ / (double)samples.size());
}

void AudioWindow::clear() {
    samples.clear();
    bufferPeaks.clear();
    peak = 0.0f;
    rms = 0.0f;
    sumSquares_ = 0.0;
    startTime = Clock::time_point{};
}

std::vector<float> AudioWindow::toFloat() const {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) out[i] = (float)samples[i] / 32768.0f;
    return out;
}
