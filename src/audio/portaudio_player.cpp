#include "audio/portaudio_player.hpp"
#include "util/log.hpp"

#include <portaudio.h>
#include <sndfile.h>

#include <string>
#include <vector>

namespace {

std::string pa_error(PaError e, const char* msg) {
    return std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e);
}

// Closes whatever was opened, in reverse order
struct PlaybackHandles {
    SNDFILE* file = nullptr;
    PaStream* stream = nullptr;

    ~PlaybackHandles() {
        if (stream) {
            Pa_StopStream(stream);
            Pa_CloseStream(stream);
        }
        if (file) sf_close(file);
    }
};

} // namespace

// Constructor
PortAudioPlayer::PortAudioPlayer(Config config) : config_(config) {}

PlaybackResult PortAudioPlayer::play(const AudioArtifact& artifact, const StopCheck& shouldStop) {
    if (!artifact.valid()) return PlaybackResult::failure("No audio artifact");

    PlaybackHandles h;

    SF_INFO info{};
    h.file = sf_open(artifact.path().c_str(), SFM_READ, &info);
    if (!h.file) {
        return PlaybackResult::failure("sf_open " + artifact.path() + ": " + sf_strerror(nullptr));
    }
    if (info.channels <= 0 || info.samplerate <= 0) {
        return PlaybackResult::failure("Unsupported audio format in " + artifact.path());
    }

    PaStreamParameters outParams{};
    outParams.device = Pa_GetDefaultOutputDevice();
    if (outParams.device == paNoDevice) return PlaybackResult::failure("No default output device");

    const PaDeviceInfo* dev = Pa_GetDeviceInfo(outParams.device);
    outParams.channelCount = info.channels;
    outParams.sampleFormat = paInt16;
    outParams.suggestedLatency = dev ? dev->defaultHighOutputLatency : 0.1;
    outParams.hostApiSpecificStreamInfo = nullptr;

    PaError e = Pa_OpenStream(&h.stream, nullptr, &outParams, info.samplerate, config_.framesPerBuffer,
                      paNoFlag, nullptr, nullptr);
    if (e != paNoError) {
        h.stream = nullptr;
        return PlaybackResult::failure(pa_error(e, "Pa_OpenStream"));
    }

    e = Pa_StartStream(h.stream);
    if (e != paNoError) return PlaybackResult::failure(pa_error(e, "Pa_StartStream"));

    logInfo("Player") << "Playing audio: " << artifact.path();

    std::vector<short> buff((size_t)config_.framesPerBuffer * (size_t)info.channels);
    for (;;) {
        if (shouldStop && shouldStop()) {
            logInfo("Player") << "Playback interrupted";
            return PlaybackResult::stopped();
        }

        const sf_count_t frames = sf_readf_short(h.file, buff.data(), config_.framesPerBuffer);
        if (frames <= 0) break;

        e = Pa_WriteStream(h.stream, buff.data(), (unsigned long)frames);
        if (e == paOutputUnderflowed) continue;
        if (e != paNoError) return PlaybackResult::failure(pa_error(e, "Pa_WriteStream"));
    }

    return PlaybackResult::completed();
}
