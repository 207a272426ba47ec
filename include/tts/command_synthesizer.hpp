#ifndef COMMAND_SYNTHESIZER_HPP
#define COMMAND_SYNTHESIZER_HPP

#include "tts/speech_synthesizer.hpp"

#include <string>

// Runs an offline TTS command line (piper or espeak-ng), feeding the text on stdin
// and collecting a WAV file.
class CommandSynthesizer : public SpeechSynthesizer {
public:
    enum class Engine { Piper, Espeak };

    struct Config {
        Engine engine = Engine::Piper;
        std::string executable = "piper";
        std::string model = "models/tts/en_US-lessac-medium.onnx";
        std::string voice = "en";
    };

    explicit CommandSynthesizer(Config config);

    SynthesisResult synthesize(const std::string& text) override;

    // Shell command line that writes to outputPath
    std::string buildCommand(const std::string& outputPath) const;

    static Engine engineFromName(const std::string& name);

private:
    Config config_;
};

std::string shellQuote(const std::string& s);

#endif
