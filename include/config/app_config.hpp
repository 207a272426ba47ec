#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "audio/continuous_recorder.hpp"
#include "audio/portaudio_player.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/voice_activity_gate.hpp"
#include "ocr/tesseract_ocr.hpp"
#include "session/session_controller.hpp"
#include "stt/whisper_transcriber.hpp"
#include "tts/command_synthesizer.hpp"
#include "vision/best_frame_selector.hpp"
#include "vision/frame_scorer.hpp"
#include "vision/opencv_camera.hpp"

#include <string>
#include <vector>

// Every tunable of the application. Defaults match an empty configuration file.
struct AppConfig {
    PortAudioSource::Config microphone;
    VoiceActivityGate::Config gate;
    ContinuousRecorder::Config recorder;
    WhisperTranscriber::Config whisper;

    OpenCvCamera::Config camera;
    BestFrameSelector::Config capture;
    FrameScorer::Config scorer;
    TesseractFastOcr::Config fastOcr;
    TesseractAccurateOcr::Config accurateOcr;

    std::vector<std::string> triggerPhrases = TriggerDetector::defaultPhrases();
    bool wordBoundaryTriggers = false;

    CommandSynthesizer::Config tts;
    PortAudioPlayer::Config player;

    SessionController::Config session;
};

// Throws ConfigError on unreadable files, malformed YAML or out-of-range values
AppConfig loadConfigFile(const std::string& path);
AppConfig loadConfigString(const std::string& yaml);

// Checks cross-field constraints; throws ConfigError
void validateConfig(const AppConfig& config);

#endif
