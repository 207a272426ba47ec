#ifndef PORTAUDIO_PLAYER_HPP
#define PORTAUDIO_PLAYER_HPP

#include "audio/audio_player.hpp"

// Decodes the artifact with libsndfile and writes it to the default output device.
// Relies on a live PortAudioRuntime.
class PortAudioPlayer : public AudioPlayer {
public:
    struct Config {
        int framesPerBuffer = 1024;
    };

    explicit PortAudioPlayer(Config config);

    PlaybackResult play(const AudioArtifact& artifact, const StopCheck& shouldStop) override;

private:
    Config config_;
};

#endif
