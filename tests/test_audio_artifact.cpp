#include <gtest/gtest.h>

#include "tts/audio_artifact.hpp"
#include "tts/command_synthesizer.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

TEST(AudioArtifactTest, CreateTempMakesUniqueFiles) {
    AudioArtifact a = AudioArtifact::createTemp(".wav");
    AudioArtifact b = AudioArtifact::createTemp(".wav");
    ASSERT_TRUE(a.valid());
    EXPECT_NE(a.path(), b.path());
    EXPECT_TRUE(fs::exists(a.path()));
    EXPECT_EQ(fs::path(a.path()).extension(), ".wav");
}

TEST(AudioArtifactTest, FileIsRemovedWhenArtifactDies) {
    std::string path;
    {
        AudioArtifact a = AudioArtifact::createTemp(".wav");
        path = a.path();
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(AudioArtifactTest, MoveTransfersOwnership) {
    AudioArtifact a = AudioArtifact::createTemp(".wav");
    const std::string path = a.path();

    AudioArtifact b(std::move(a));
    EXPECT_FALSE(a.valid());
    EXPECT_EQ(b.path(), path);

    AudioArtifact c;
    c = std::move(b);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_TRUE(c.release());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(c.valid());
}

TEST(AudioArtifactTest, ReleasingMissingFileIsHarmless) {
    AudioArtifact a = AudioArtifact::createTemp(".wav");
    fs::remove(a.path());
    EXPECT_TRUE(a.release());
    EXPECT_TRUE(a.release());
}

TEST(AudioArtifactTest, FailedDeletionIsReportedNotThrown) {
    const fs::path dir = fs::path(::testing::TempDir()) / "readback_artifact_busy";
    fs::create_directories(dir);
    { std::ofstream(dir / "keep.txt") << "x"; }

    AudioArtifact a(dir.string());
    bool released = true;
    EXPECT_NO_THROW(released = a.release());
    EXPECT_FALSE(released);
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(fs::exists(dir / "keep.txt"));

    fs::remove_all(dir);
}

TEST(CommandSynthesizerTest, PiperCommandQuotesArguments) {
    CommandSynthesizer::Config config;
    config.model = "voices/it's.onnx";
    CommandSynthesizer synth(config);
    EXPECT_EQ(synth.buildCommand("/tmp/out.wav"),
              "'piper' --model 'voices/it'\\''s.onnx' --output_file '/tmp/out.wav' >/dev/null 2>&1");
}

TEST(CommandSynthesizerTest, EspeakCommandReadsStdin) {
    CommandSynthesizer::Config config;
    config.engine = CommandSynthesizer::Engine::Espeak;
    config.executable = "espeak-ng";
    CommandSynthesizer synth(config);
    EXPECT_EQ(synth.buildCommand("/tmp/a.wav"), "'espeak-ng' -v 'en' --stdin -w '/tmp/a.wav' >/dev/null 2>&1");
}

TEST(CommandSynthesizerTest, EmptyTextProducesNothing) {
    CommandSynthesizer synth(CommandSynthesizer::Config{});
    EXPECT_EQ(synth.synthesize("").status, ResultStatus::Empty);
}
