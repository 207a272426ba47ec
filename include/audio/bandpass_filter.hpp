#ifndef BANDPASS_FILTER_HPP
#define BANDPASS_FILTER_HPP

#include <cstdint>
#include <vector>

// Cascaded biquad band-pass that keeps the speech band before level measurement.
// Filter state carries across calls so consecutive device buffers are filtered as one stream.
class BandpassFilter {
public:
    struct Config {
        float lowHz = 300.0f;
        float highHz = 3000.0f;
        int sections = 2;
    };

    BandpassFilter(int sampleRate, Config config);

    // Filters the buffer and returns the absolute peak of the output, in int16 units
    float processPeak(const int16_t* samples, int frames);

    void reset();

private:
    struct Biquad {
        float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
        float a1 = 0.0f, a2 = 0.0f;
        float z1 = 0.0f, z2 = 0.0f;

        float process(float x);
    };

    std::vector<Biquad> stages_;
};

#endif
