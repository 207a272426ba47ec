#include "tts/command_synthesizer.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#include <sys/wait.h>

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char ch : s) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

// Constructor
CommandSynthesizer::CommandSynthesizer(Config config) : config_(std::move(config)) {}

CommandSynthesizer::Engine CommandSynthesizer::engineFromName(const std::string& name) {
    if (name == "piper") return Engine::Piper;
    if (name == "espeak" || name == "espeak-ng") return Engine::Espeak;
    throw ConfigError("Unknown tts engine '" + name + "' (expected piper or espeak)");
}

std::string CommandSynthesizer::buildCommand(const std::string& outputPath) const {
    std::string cmd = shellQuote(config_.executable);
    if (config_.engine == Engine::Piper) {
        cmd += " --model " + shellQuote(config_.model) + " --output_file " + shellQuote(outputPath);
    } else {
        cmd += " -v " + shellQuote(config_.voice) + " --stdin -w " + shellQuote(outputPath);
    }
    return cmd + " >/dev/null 2>&1";
}

SynthesisResult CommandSynthesizer::synthesize(const std::string& text) {
    if (text.empty()) return SynthesisResult{};

    try {
        AudioArtifact artifact = AudioArtifact::createTemp(".wav");
        const std::string cmd = buildCommand(artifact.path());

        FILE* pipe = ::popen(cmd.c_str(), "w");
        if (!pipe) {
            return SynthesisResult::failure("popen failed for " + config_.executable);
        }

        const std::string input = text + "\n";
        const size_t written = std::fwrite(input.data(), 1, input.size(), pipe);
        const int status = ::pclose(pipe);

        if (written != input.size()) {
            return SynthesisResult::failure("Short write to " + config_.executable);
        }
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            return SynthesisResult::failure(config_.executable + " exited with status " +
                                            std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status));
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(artifact.path(), ec);
        if (ec || size == 0) {
            return SynthesisResult::failure(config_.executable + " produced no audio");
        }

        logInfo("Speaker") << "Synthesized " << text.size() << " chars to " << artifact.path();
        return SynthesisResult::ok(std::move(artifact));
    } catch (const std::exception& e) {
        logError("Speaker") << e.what();
        return SynthesisResult::failure(e.what());
    }
}
