#ifndef PORTAUDIO_SOURCE_HPP
#define PORTAUDIO_SOURCE_HPP

#include "audio/audio_source.hpp"

typedef void PaStream;

class PortAudioSource : public AudioSource {
public:
    struct Config {
        int sampleRate = 16000;
        int framesPerBuffer = 1024;
    };

    explicit PortAudioSource(Config config);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void open() override;
    ReadStatus read(std::vector<int16_t>& buffer) override;
    void close() override;

    int sampleRate() const override { return config_.sampleRate; }
    int framesPerBuffer() const override { return config_.framesPerBuffer; }

private:
    Config config_;
    PaStream* stream_ = nullptr;
};

#endif
