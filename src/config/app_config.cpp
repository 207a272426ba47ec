#include "config/app_config.hpp"
#include "core/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (!value) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

AppConfig fromNode(const YAML::Node& root) {
    AppConfig c;
    if (!root || root.IsNull()) return c;
    if (!root.IsMap()) throw ConfigError("Configuration root must be a mapping");

    if (const YAML::Node audio = root["audio"]) {
        read(audio, "recordingIntervalSeconds", c.recorder.recordingIntervalSeconds);
        read(audio, "vadThreshold", c.gate.vadThreshold);
        read(audio, "sampleRate", c.microphone.sampleRate);
        read(audio, "framesPerBuffer", c.microphone.framesPerBuffer);
        read(audio, "calibrationWindows", c.gate.calibrationWindows);
        read(audio, "calibrationMarginStdDevs", c.gate.floorMarginStdDevs);
        read(audio, "speechRunBuffers", c.gate.speechRunBuffers);
        read(audio, "bandLowHz", c.recorder.bandpass.lowHz);
        read(audio, "bandHighHz", c.recorder.bandpass.highHz);
        read(audio, "transcriptionBacklogWarn", c.recorder.transcriptionBacklogWarn);
    }

    if (const YAML::Node recognition = root["recognition"]) {
        read(recognition, "language", c.recorder.recognitionLanguage);
        read(recognition, "whisperModel", c.whisper.modelPath);
        read(recognition, "threads", c.whisper.threads);
    }

    if (const YAML::Node capture = root["capture"]) {
        read(capture, "windowSeconds", c.capture.captureWindowSeconds);
        read(capture, "cameraIndex", c.camera.cameraIndex);
        read(capture, "width", c.camera.width);
        read(capture, "height", c.camera.height);
    }

    if (const YAML::Node triggers = root["triggers"]) {
        read(triggers, "phrases", c.triggerPhrases);
        read(triggers, "wordBoundary", c.wordBoundaryTriggers);
    }

    if (const YAML::Node ocr = root["ocr"]) {
        read(ocr, "language", c.fastOcr.language);
        c.accurateOcr.language = c.fastOcr.language;
        read(ocr, "tessdataPath", c.fastOcr.tessdataPath);
        c.accurateOcr.tessdataPath = c.fastOcr.tessdataPath;
        read(ocr, "fastPageSegMode", c.fastOcr.pageSegMode);
        read(ocr, "accuratePageSegMode", c.accurateOcr.pageSegMode);
        read(ocr, "minLineConfidence", c.accurateOcr.minLineConfidence);
        read(ocr, "detectOrientation", c.accurateOcr.detectOrientation);
    }

    if (const YAML::Node tts = root["tts"]) {
        std::string engine;
        read(tts, "engine", engine);
        if (!engine.empty()) {
            c.tts.engine = CommandSynthesizer::engineFromName(engine);
            if (c.tts.engine == CommandSynthesizer::Engine::Espeak) c.tts.executable = "espeak-ng";
        }
        read(tts, "executable", c.tts.executable);
        read(tts, "model", c.tts.model);
        read(tts, "voice", c.tts.voice);
    }

    return c;
}

} // namespace

AppConfig loadConfigFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot read configuration file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed configuration file " + path + ": " + e.what());
    }

    AppConfig c = fromNode(root);
    validateConfig(c);
    return c;
}

AppConfig loadConfigString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    AppConfig c = fromNode(root);
    validateConfig(c);
    return c;
}

void validateConfig(const AppConfig& c) {
    if (c.recorder.recordingIntervalSeconds <= 0.0) throw ConfigError("recordingIntervalSeconds must be > 0");
    if (c.gate.vadThreshold < 0.0f) throw ConfigError("vadThreshold must be >= 0");
    if (c.microphone.sampleRate <= 0) throw ConfigError("sampleRate must be > 0");
    if (c.microphone.framesPerBuffer <= 0) throw ConfigError("framesPerBuffer must be > 0");
    if (c.gate.calibrationWindows <= 0) throw ConfigError("calibrationWindows must be > 0");
    if (c.gate.speechRunBuffers <= 0) throw ConfigError("speechRunBuffers must be > 0");
    if (c.recorder.bandpass.lowHz >= c.recorder.bandpass.highHz) throw ConfigError("bandLowHz must be below bandHighHz");
    if (c.recorder.recognitionLanguage.empty()) throw ConfigError("recognition language must not be empty");
    if (c.capture.captureWindowSeconds <= 0.0) throw ConfigError("capture windowSeconds must be > 0");
    if (c.camera.cameraIndex < 0) throw ConfigError("cameraIndex must be >= 0");
    if (c.triggerPhrases.empty()) throw ConfigError("at least one trigger phrase is required");
    for (const auto& phrase : c.triggerPhrases) {
        if (TriggerDetector::normalize(phrase).empty()) throw ConfigError("trigger phrase '" + phrase + "' is empty");
    }
}
