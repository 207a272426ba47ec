#ifndef AUDIO_PLAYER_HPP
#define AUDIO_PLAYER_HPP

#include "core/service_result.hpp"
#include "tts/audio_artifact.hpp"

#include <functional>
#include <string>
#include <utility>

struct PlaybackResult {
    ResultStatus status = ResultStatus::Ok;
    bool cancelled = false;
    std::string error;

    static PlaybackResult completed() { return PlaybackResult{}; }

    static PlaybackResult stopped() {
        PlaybackResult r;
        r.cancelled = true;
        return r;
    }

    static PlaybackResult failure(std::string message) {
        PlaybackResult r;
        r.status = ResultStatus::Error;
        r.error = std::move(message);
        return r;
    }

    bool ok() const { return status == ResultStatus::Ok; }
};

class AudioPlayer {
public:
    using StopCheck = std::function<bool()>;

    virtual ~AudioPlayer() = default;

    // Blocks until playback completes, fails, or shouldStop() turns true
    virtual PlaybackResult play(const AudioArtifact& artifact, const StopCheck& shouldStop) = 0;
};

#endif
