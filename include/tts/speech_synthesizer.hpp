#ifndef SPEECH_SYNTHESIZER_HPP
#define SPEECH_SYNTHESIZER_HPP

#include "core/service_result.hpp"
#include "tts/audio_artifact.hpp"

#include <string>
#include <utility>

struct SynthesisResult {
    ResultStatus status = ResultStatus::Empty;
    AudioArtifact artifact;
    std::string error;

    static SynthesisResult ok(AudioArtifact artifact) {
        SynthesisResult r;
        r.status = ResultStatus::Ok;
        r.artifact = std::move(artifact);
        return r;
    }

    static SynthesisResult failure(std::string message) {
        SynthesisResult r;
        r.status = ResultStatus::Error;
        r.error = std::move(message);
        return r;
    }
};

// Text plus the synthesized audio; the artifact file lives exactly as long as this object
struct SpokenUtterance {
    std::string text;
    AudioArtifact artifact;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    virtual SynthesisResult synthesize(const std::string& text) = 0;
};

#endif
