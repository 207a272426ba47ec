#include <gtest/gtest.h>

#include "session/session_controller.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace testing_helpers;
using namespace std::chrono_literals;

class SessionControllerTest : public ::testing::Test {
protected:
    SessionControllerTest() {
        camera.repeatLast = true;
        camera.pushFrame(1);
    }

    SessionController::Services services(FrameSource& cam) {
        return SessionController::Services{monitor, cam,        display, trigger, scorer,
                                           selector, accurateOcr, synth,   player};
    }

    // Calibrated, monitoring, and a trigger phrase already heard
    void driveToCapturing() {
        monitor.calibrated = true;
        ASSERT_EQ(controller.tick(), SessionState::Monitoring);
        monitor.say("What is written here?");
        ASSERT_EQ(controller.tick(), SessionState::Capturing);
    }

    FakeClock clock;
    FakeAudioMonitor monitor;
    FakeFrameSource camera{&clock, 1s};
    FakeDisplay display;
    TriggerDetector trigger{TriggerDetector::defaultPhrases()};
    FakeFastOcr fastOcr;
    FrameScorer scorer{fastOcr};
    BestFrameSelector selector{BestFrameSelector::Config{10.0, 0}, [this] { return clock.now(); }};
    FakeAccurateOcr accurateOcr;
    FakeSynthesizer synth;
    FakePlayer player;
    SessionController controller{SessionController::Config{}, services(camera)};
};

TEST_F(SessionControllerTest, StaysCalibratingUntilMonitorIsReady) {
    EXPECT_EQ(controller.tick(), SessionState::Calibrating);
    EXPECT_EQ(controller.tick(), SessionState::Calibrating);
    ASSERT_FALSE(display.states.empty());
    EXPECT_EQ(display.states.back(), SessionState::Calibrating);
    EXPECT_EQ(display.messages.back(), "Calibrating noise...");

    monitor.calibrated = true;
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
}

TEST_F(SessionControllerTest, MonitoringShowsCountdownToNextRecording) {
    monitor.calibrated = true;
    controller.tick();
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(display.states.back(), SessionState::Monitoring);
    EXPECT_EQ(display.messages.back(), "Next recording in: 8s");
}

TEST_F(SessionControllerTest, OrdinarySpeechDoesNotTrigger) {
    monitor.calibrated = true;
    controller.tick();
    monitor.say("hello world");
    monitor.say("");
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(controller.capturesRun(), 0u);
}

TEST_F(SessionControllerTest, FailedTranscriptIsIgnored) {
    monitor.calibrated = true;
    controller.tick();

    TranscriptEvent failed;
    failed.text = "what is written here";
    failed.status = ResultStatus::Error;
    failed.error = "decoder error";
    monitor.transcripts.push_back(failed);

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
}

TEST_F(SessionControllerTest, TriggerReadsBestFrameAloud) {
    fastOcr.defaultWords = 3;
    driveToCapturing();

    EXPECT_EQ(controller.tick(), SessionState::Speaking);
    EXPECT_EQ(accurateOcr.calls, 1);
    EXPECT_EQ(display.states.back(), SessionState::Capturing);

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    ASSERT_EQ(synth.texts.size(), 1u);
    EXPECT_EQ(synth.texts[0], "STOP");
    EXPECT_EQ(player.calls, 1);
    EXPECT_TRUE(player.fileExistedDuringPlay);
    EXPECT_FALSE(std::filesystem::exists(synth.lastPath));
    EXPECT_EQ(controller.capturesRun(), 1u);
    EXPECT_EQ(controller.utterancesSpoken(), 1u);
}

TEST_F(SessionControllerTest, NoTextInWindowReturnsToMonitoringSilently) {
    fastOcr.defaultWords = 0;
    driveToCapturing();

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(accurateOcr.calls, 0);
    EXPECT_TRUE(synth.texts.empty());
    EXPECT_EQ(player.calls, 0);
}

TEST_F(SessionControllerTest, AccurateOcrErrorSkipsSynthesis) {
    fastOcr.defaultWords = 3;
    accurateOcr.reply = TextResult::failure("tesseract init failed");
    driveToCapturing();

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_TRUE(synth.texts.empty());
}

TEST_F(SessionControllerTest, AccurateOcrWithoutTextSkipsSynthesis) {
    fastOcr.defaultWords = 3;
    accurateOcr.reply = TextResult::empty();
    driveToCapturing();

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_TRUE(synth.texts.empty());
}

TEST_F(SessionControllerTest, PlaybackFailureStillDeletesAudio) {
    fastOcr.defaultWords = 3;
    player.failing = true;
    driveToCapturing();

    EXPECT_EQ(controller.tick(), SessionState::Speaking);
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(player.calls, 1);
    EXPECT_TRUE(player.fileExistedDuringPlay);
    EXPECT_FALSE(std::filesystem::exists(synth.lastPath));
    EXPECT_EQ(controller.utterancesSpoken(), 0u);
}

TEST_F(SessionControllerTest, PlayerExceptionStillDeletesAudio) {
    fastOcr.defaultWords = 3;
    player.throws = true;
    driveToCapturing();

    controller.tick();
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_FALSE(std::filesystem::exists(synth.lastPath));
}

TEST_F(SessionControllerTest, SynthesisFailureSkipsPlayback) {
    fastOcr.defaultWords = 3;
    synth.failing = true;
    driveToCapturing();

    controller.tick();
    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(player.calls, 0);
}

TEST_F(SessionControllerTest, QuitDuringCaptureShutsEverythingDown) {
    fastOcr.defaultWords = 3;
    display.quitOnState = SessionState::Capturing;
    driveToCapturing();

    controller.tick();
    EXPECT_TRUE(controller.shutdownRequested());
    EXPECT_EQ(controller.tick(), SessionState::Shutdown);

    EXPECT_TRUE(monitor.stopped);
    EXPECT_TRUE(camera.released);
    EXPECT_TRUE(display.closed);
    EXPECT_EQ(accurateOcr.calls, 0);
    EXPECT_TRUE(synth.texts.empty());
}

TEST_F(SessionControllerTest, QuitKeyDuringPlaybackStopsIt) {
    fastOcr.defaultWords = 3;
    player.chunks = 20;
    driveToCapturing();
    ASSERT_EQ(controller.tick(), SessionState::Speaking);

    // One poll before playback starts, then 'q' arrives while the second chunk plays
    display.quitAfterPolls = display.polls + 2;

    EXPECT_EQ(controller.tick(), SessionState::Monitoring);
    EXPECT_EQ(player.calls, 1);
    EXPECT_EQ(player.stoppedAtChunk, 1);
    EXPECT_TRUE(controller.shutdownRequested());
    EXPECT_FALSE(std::filesystem::exists(synth.lastPath));
    EXPECT_EQ(controller.utterancesSpoken(), 0u);

    EXPECT_EQ(controller.tick(), SessionState::Shutdown);
    EXPECT_TRUE(monitor.stopped);
    EXPECT_TRUE(display.closed);
}

TEST_F(SessionControllerTest, ShutdownRequestEndsRunCleanly) {
    controller.requestShutdown();
    EXPECT_EQ(controller.run(), 0);
    EXPECT_EQ(controller.state(), SessionState::Shutdown);
    EXPECT_TRUE(monitor.stopped);
    EXPECT_TRUE(camera.released);
}

TEST_F(SessionControllerTest, LostCameraEndsRunWithFailure) {
    FakeFrameSource deadCamera;
    SessionController::Config config;
    config.maxFailedReads = 5;
    SessionController session(config, services(deadCamera));

    EXPECT_EQ(session.run(), 1);
    EXPECT_EQ(deadCamera.reads, 5);
    EXPECT_TRUE(deadCamera.released);
}

TEST(SessionStateTest, NamesAreStable) {
    EXPECT_STREQ(toString(SessionState::Calibrating), "Calibrating");
    EXPECT_STREQ(toString(SessionState::Monitoring), "Monitoring");
    EXPECT_STREQ(toString(SessionState::Capturing), "Capturing");
    EXPECT_STREQ(toString(SessionState::Speaking), "Speaking");
    EXPECT_STREQ(toString(SessionState::Shutdown), "Shutdown");
}
