#include "audio/bandpass_filter.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

// Constructor, designs one constant-peak-gain band-pass section and repeats it
BandpassFilter::BandpassFilter(int sampleRate, Config config) {
    const double fs = std::max(1, sampleRate);
    const double nyquistGuard = fs * 0.45;
    const double low = std::max(1.0, (double)config.lowHz);
    const double high = std::max(low + 1.0, std::min((double)config.highHz, nyquistGuard));

    const double f0 = std::sqrt(low * high);
    const double q = f0 / (high - low);
    const double w0 = 2.0 * kPi * f0 / fs;
    const double alpha = std::sin(w0) / (2.0 * q);
    const double a0 = 1.0 + alpha;

    Biquad section;
    section.b0 = (float)(alpha / a0);
    section.b1 = 0.0f;
    section.b2 = (float)(-alpha / a0);
    section.a1 = (float)(-2.0 * std::cos(w0) / a0);
    section.a2 = (float)((1.0 - alpha) / a0);

    stages_.assign((size_t)std::max(1, config.sections), section);
}

// Transposed direct form II
float BandpassFilter::Biquad::process(float x) {
    const float y = b0 * x + z1;
    z1 = b1 * x - a1 * y + z2;
    z2 = b2 * x - a2 * y;
    return y;
}

float BandpassFilter::processPeak(const int16_t* samples, int frames) {
    float peak = 0.0f;
    for (int i = 0; i < frames; ++i) {
        float y = (float)samples[i];
        for (auto& stage : stages_) y = stage.process(y);
        peak = std::max(peak, std::fabs(y));
    }
    return peak;
}

void BandpassFilter::reset() {
    for (auto& stage : stages_) {
        stage.z1 = 0.0f;
        stage.z2 = 0.0f;
    }
}
