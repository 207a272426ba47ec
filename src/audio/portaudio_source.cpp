#include "audio/portaudio_source.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

#include <portaudio.h>

#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw DeviceError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PortAudioSource::PortAudioSource(Config config) : config_(config) {}

// Destructor
PortAudioSource::~PortAudioSource() { close(); }

// Opens the default input device as 16-bit mono and starts the stream.
// PortAudio must already be initialized (see PortAudioRuntime).
void PortAudioSource::open() {
    if (stream_) return;

    try {
        PaStreamParameters inParams{};
        inParams.device = Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice) {
            throw DeviceError("No default input device");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        logInfo("Microphone") << "Input device: " << (info ? info->name : "(unknown)");

        inParams.channelCount = 1;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          config_.sampleRate, config_.framesPerBuffer,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );

        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (...) {
        close();
        throw;
    }
}

// Blocks until one buffer of framesPerBuffer samples is available
AudioSource::ReadStatus PortAudioSource::read(std::vector<int16_t>& buffer) {
    if (!stream_) return ReadStatus::EndOfStream;

    buffer.resize((size_t)config_.framesPerBuffer);
    const PaError e = Pa_ReadStream(stream_, buffer.data(), (unsigned long)config_.framesPerBuffer);
    if (e == paInputOverflowed) return ReadStatus::Overflow;
    if (e != paNoError) {
        logWarn("Microphone") << "Pa_ReadStream (" << (int)e << "): " << Pa_GetErrorText(e);
        return ReadStatus::Error;
    }
    return ReadStatus::Ok;
}

// Stops and closes the stream
void PortAudioSource::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}
