#ifndef AUDIO_WINDOW_HPP
#define AUDIO_WINDOW_HPP

#include <chrono>
#include <cstdint>
#include <vector>

// Fixed-duration block of mono int16 samples plus its amplitude profile.
// bufferPeaks holds the band-passed peak of every device buffer appended to the window.
struct AudioWindow {
    using Clock = std::chrono::steady_clock;

    std::vector<int16_t> samples;
    std::vector<float> bufferPeaks;
    int sampleRate = 16000;
    Clock::time_point startTime{};

    float peak = 0.0f;
    float rms = 0.0f;

    void append(const int16_t* data, int frames, float bandPeak);
    void clear();

    bool empty() const { return samples.empty(); }

    // Normalized [-1, 1] copy for engines that consume float PCM
    std::vector<float> toFloat() const;

private:
    double sumSquares_ = 0.0;
};

#endif
