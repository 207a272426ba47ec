#include "headers.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<SessionController*> g_session{nullptr};

void handle_signal(int) {
    if (SessionController* session = g_session.load()) session->requestShutdown();
}

std::string configPath(int argc, char** argv) {
    if (argc > 1 && argv[1]) return argv[1];
    const char* env = std::getenv("READBACK_CONFIG");
    return env ? env : "";
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << "readback " << kReadbackVersion << "\n"
                  << "Usage: readback [config.yaml]\n"
                  << "Say \"what is written here\" to have the text in view read aloud. Press 'q' to quit.\n";
        return 0;
    }

    AppConfig config;
    const std::string path = configPath(argc, argv);
    try {
        if (!path.empty()) {
            config = loadConfigFile(path);
            logInfo("Main") << "Loaded configuration from " << path;
        }
    } catch (const ConfigError& e) {
        logError("Main") << e.what();
        return 2;
    }

    logInfo("Main") << "Initializing OCR and audio processing components...";

    std::unique_ptr<TesseractFastOcr> fastOcr;
    std::unique_ptr<TesseractAccurateOcr> accurateOcr;
    std::unique_ptr<WhisperTranscriber> transcriber;
    try {
        fastOcr = std::make_unique<TesseractFastOcr>(config.fastOcr);
        accurateOcr = std::make_unique<TesseractAccurateOcr>(config.accurateOcr);
        transcriber = std::make_unique<WhisperTranscriber>(config.whisper);
    } catch (const std::exception& e) {
        logError("Main") << "Fatal error loading engines: " << e.what();
        return 1;
    }

    OpenCvCamera camera(config.camera);
    try {
        camera.open();
    } catch (const DeviceError& e) {
        logError("Main") << "Error: " << e.what();
        return 1;
    }

    std::unique_ptr<PortAudioRuntime> portAudio;
    try {
        portAudio = std::make_unique<PortAudioRuntime>();
    } catch (const DeviceError& e) {
        logError("Main") << "Failed to initialize audio: " << e.what();
        camera.release();
        return 1;
    }

    PortAudioSource microphone(config.microphone);
    VoiceActivityGate gate(config.gate);
    ContinuousRecorder recorder(config.recorder, microphone, gate, *transcriber);
    try {
        recorder.start();
    } catch (const DeviceError& e) {
        logError("Main") << "Failed to initialize audio recorder: " << e.what();
        camera.release();
        return 1;
    }

    std::unique_ptr<MatchStrategy> strategy;
    if (config.wordBoundaryTriggers) {
        strategy = std::make_unique<WordSequenceMatchStrategy>();
    } else {
        strategy = std::make_unique<SubstringMatchStrategy>();
    }
    TriggerDetector trigger(config.triggerPhrases, std::move(strategy));

    FrameScorer scorer(*fastOcr, config.scorer);
    BestFrameSelector selector(config.capture);
    CommandSynthesizer synthesizer(config.tts);
    PortAudioPlayer player(config.player);
    OpenCvStatusDisplay display;

    SessionController session(config.session,
                              SessionController::Services{recorder, camera, display, trigger, scorer, selector,
                                                          *accurateOcr, synthesizer, player});

    g_session.store(&session);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    // A TTS process that exits early shows up as a failed write, not a signal
    std::signal(SIGPIPE, SIG_IGN);

    const int rc = session.run();

    g_session.store(nullptr);
    return rc;
}
