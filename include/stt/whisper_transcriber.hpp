#ifndef WHISPER_TRANSCRIBER_HPP
#define WHISPER_TRANSCRIBER_HPP

#include "stt/transcriber.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

class WhisperTranscriber : public Transcriber {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en.bin";
        int threads = 4;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperTranscriber(Config config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    TextResult transcribe(const AudioWindow& window, const std::string& language) override;

private:
    std::string run(const std::vector<float>& pcm16kMono, const std::string& language);

    Config config_;
    whisper_context* context_ = nullptr;
    std::mutex mutex_;
};

#endif
