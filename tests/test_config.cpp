#include <gtest/gtest.h>

#include "config/app_config.hpp"
#include "core/errors.hpp"

#include <cstdio>
#include <fstream>

TEST(AppConfigTest, EmptyDocumentGivesDefaults) {
    const AppConfig c = loadConfigString("");
    EXPECT_DOUBLE_EQ(c.recorder.recordingIntervalSeconds, 10.0);
    EXPECT_FLOAT_EQ(c.gate.vadThreshold, 2000.0f);
    EXPECT_EQ(c.microphone.sampleRate, 16000);
    EXPECT_EQ(c.recorder.recognitionLanguage, "en");
    EXPECT_DOUBLE_EQ(c.capture.captureWindowSeconds, 10.0);
    EXPECT_EQ(c.camera.cameraIndex, 0);
    EXPECT_EQ(c.triggerPhrases, TriggerDetector::defaultPhrases());
    EXPECT_EQ(c.tts.engine, CommandSynthesizer::Engine::Piper);
    EXPECT_EQ(c.fastOcr.pageSegMode, 6);
    EXPECT_TRUE(c.accurateOcr.detectOrientation);
}

TEST(AppConfigTest, OverridesAreApplied) {
    const AppConfig c = loadConfigString(R"(
audio:
  recordingIntervalSeconds: 5
  vadThreshold: 1200
  calibrationWindows: 20
recognition:
  language: de
  threads: 2
capture:
  windowSeconds: 4
  cameraIndex: 2
triggers:
  phrases: ["read this", "what does it say"]
  wordBoundary: true
ocr:
  language: deu
  tessdataPath: /opt/tessdata
  detectOrientation: false
)");
    EXPECT_DOUBLE_EQ(c.recorder.recordingIntervalSeconds, 5.0);
    EXPECT_FLOAT_EQ(c.gate.vadThreshold, 1200.0f);
    EXPECT_EQ(c.gate.calibrationWindows, 20);
    EXPECT_EQ(c.recorder.recognitionLanguage, "de");
    EXPECT_EQ(c.whisper.threads, 2);
    EXPECT_DOUBLE_EQ(c.capture.captureWindowSeconds, 4.0);
    EXPECT_EQ(c.camera.cameraIndex, 2);
    ASSERT_EQ(c.triggerPhrases.size(), 2u);
    EXPECT_EQ(c.triggerPhrases[1], "what does it say");
    EXPECT_TRUE(c.wordBoundaryTriggers);
    EXPECT_EQ(c.fastOcr.language, "deu");
    EXPECT_EQ(c.accurateOcr.language, "deu");
    EXPECT_EQ(c.accurateOcr.tessdataPath, "/opt/tessdata");
    EXPECT_FALSE(c.accurateOcr.detectOrientation);
}

TEST(AppConfigTest, EspeakEngineSwitchesDefaultExecutable) {
    const AppConfig c = loadConfigString("tts:\n  engine: espeak\n  voice: en-us\n");
    EXPECT_EQ(c.tts.engine, CommandSynthesizer::Engine::Espeak);
    EXPECT_EQ(c.tts.executable, "espeak-ng");
    EXPECT_EQ(c.tts.voice, "en-us");
}

TEST(AppConfigTest, UnknownEngineIsRejected) {
    EXPECT_THROW(loadConfigString("tts:\n  engine: festival\n"), ConfigError);
}

TEST(AppConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(loadConfigString("audio:\n  recordingIntervalSeconds: 0\n"), ConfigError);
    EXPECT_THROW(loadConfigString("audio:\n  vadThreshold: -1\n"), ConfigError);
    EXPECT_THROW(loadConfigString("capture:\n  windowSeconds: -3\n"), ConfigError);
    EXPECT_THROW(loadConfigString("capture:\n  cameraIndex: -1\n"), ConfigError);
    EXPECT_THROW(loadConfigString("triggers:\n  phrases: []\n"), ConfigError);
    EXPECT_THROW(loadConfigString("triggers:\n  phrases: [\"?!\"]\n"), ConfigError);
    EXPECT_THROW(loadConfigString("recognition:\n  language: \"\"\n"), ConfigError);
}

TEST(AppConfigTest, WrongTypesAndMalformedYamlAreRejected) {
    EXPECT_THROW(loadConfigString("audio:\n  sampleRate: fast\n"), ConfigError);
    EXPECT_THROW(loadConfigString("audio: [1, 2\n"), ConfigError);
    EXPECT_THROW(loadConfigString("- just\n- a list\n"), ConfigError);
}

TEST(AppConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "readback_config_test.yaml";
    {
        std::ofstream out(path);
        out << "capture:\n  windowSeconds: 3\n";
    }
    const AppConfig c = loadConfigFile(path);
    EXPECT_DOUBLE_EQ(c.capture.captureWindowSeconds, 3.0);
    std::remove(path.c_str());
}

TEST(AppConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(loadConfigFile("/nonexistent/readback.yaml"), ConfigError);
}
