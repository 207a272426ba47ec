#include <gtest/gtest.h>

#include "audio/bandpass_filter.hpp"
#include "audio/voice_activity_gate.hpp"
#include "test_helpers.hpp"

#include <random>

using namespace testing_helpers;

namespace {

VoiceActivityGate::Config smallConfig() {
    VoiceActivityGate::Config c;
    c.vadThreshold = 2000.0f;
    c.calibrationWindows = 5;
    c.speechRunBuffers = 3;
    return c;
}

void calibrate(VoiceActivityGate& gate, float level = 100.0f) {
    for (int i = 0; i < gate.config().calibrationWindows; ++i) gate.observeForCalibration(windowWithPeaks({level}));
}

} // namespace

TEST(VoiceActivityGateTest, UncalibratedGateAlwaysSilent) {
    VoiceActivityGate gate(smallConfig());
    EXPECT_FALSE(gate.isCalibrated());
    EXPECT_EQ(gate.classify(windowWithPeaks({30000, 30000, 30000, 30000})), VoiceActivityGate::Decision::Silence);
}

TEST(VoiceActivityGateTest, CalibratesAfterConfiguredWindowCount) {
    VoiceActivityGate gate(smallConfig());
    for (int i = 0; i < 4; ++i) {
        gate.observeForCalibration(windowWithPeaks({100.0f + i}));
        EXPECT_FALSE(gate.isCalibrated());
    }
    gate.observeForCalibration(windowWithPeaks({104.0f}));
    ASSERT_TRUE(gate.isCalibrated());

    const auto profile = gate.noiseProfile();
    EXPECT_TRUE(profile.frozen);
    EXPECT_EQ(profile.sampleCount, 5);
    EXPECT_NEAR(profile.mean, 102.0f, 1e-3);
    EXPECT_NEAR(profile.floor, profile.mean + 2.0f * profile.stddev, 1e-3);
}

TEST(VoiceActivityGateTest, EmptyWindowsDoNotCountTowardCalibration) {
    VoiceActivityGate gate(smallConfig());
    for (int i = 0; i < 20; ++i) gate.observeForCalibration(AudioWindow{});
    EXPECT_FALSE(gate.isCalibrated());
    EXPECT_EQ(gate.noiseProfile().sampleCount, 0);
}

TEST(VoiceActivityGateTest, HighVarianceAmbientStallsCalibration) {
    VoiceActivityGate gate(smallConfig());
    for (int i = 0; i < 200; ++i) gate.observeForCalibration(windowWithPeaks({(i % 2) ? 9000.0f : 50.0f}));
    EXPECT_FALSE(gate.isCalibrated());
    EXPECT_EQ(gate.classify(windowWithPeaks({20000, 20000, 20000})), VoiceActivityGate::Decision::Silence);
}

TEST(VoiceActivityGateTest, RecoversOnceAmbientSettles) {
    VoiceActivityGate gate(smallConfig());
    for (int i = 0; i < 10; ++i) gate.observeForCalibration(windowWithPeaks({(i % 2) ? 9000.0f : 50.0f}));
    EXPECT_FALSE(gate.isCalibrated());
    calibrate(gate, 120.0f);
    EXPECT_TRUE(gate.isCalibrated());
    EXPECT_NEAR(gate.noiseProfile().floor, 120.0f, 1e-3);
}

TEST(VoiceActivityGateTest, CalibrationIsMonotoneAndFrozen) {
    VoiceActivityGate gate(smallConfig());
    calibrate(gate);
    const auto before = gate.noiseProfile();

    for (int i = 0; i < 50; ++i) {
        gate.observeForCalibration(windowWithPeaks({(float)(i * 700)}));
        ASSERT_TRUE(gate.isCalibrated());
    }
    const auto after = gate.noiseProfile();
    EXPECT_EQ(after.floor, before.floor);
    EXPECT_EQ(after.sampleCount, before.sampleCount);
}

TEST(VoiceActivityGateTest, SpeechNeedsConsecutiveLoudBuffers) {
    VoiceActivityGate gate(smallConfig());
    calibrate(gate);
    const float loud = gate.speechLevel() + 1.0f;

    EXPECT_EQ(gate.classify(windowWithPeaks({100, loud, loud, 100, loud, 100})),
              VoiceActivityGate::Decision::Silence);
    EXPECT_EQ(gate.classify(windowWithPeaks({100, loud, loud, loud, 100})), VoiceActivityGate::Decision::Speech);
}

TEST(VoiceActivityGateTest, PeakExactlyAtLevelIsSilence) {
    VoiceActivityGate gate(smallConfig());
    calibrate(gate);
    const float level = gate.speechLevel();
    EXPECT_EQ(gate.classify(windowWithPeaks({level, level, level, level})), VoiceActivityGate::Decision::Silence);
}

TEST(VoiceActivityGateTest, ShortWindowUsesAllItsBuffers) {
    VoiceActivityGate gate(smallConfig());
    calibrate(gate);
    const float loud = gate.speechLevel() + 1.0f;
    EXPECT_EQ(gate.classify(windowWithPeaks({loud, loud})), VoiceActivityGate::Decision::Speech);
    EXPECT_EQ(gate.classify(windowWithPeaks({loud, 10})), VoiceActivityGate::Decision::Silence);
}

TEST(VoiceActivityGateTest, AnythingBelowFloorIsSilence) {
    VoiceActivityGate gate(smallConfig());
    calibrate(gate, 400.0f);
    const float floor = gate.noiseProfile().floor;

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> below(0.0f, floor);
    for (int trial = 0; trial < 200; ++trial) {
        std::vector<float> peaks(1 + rng() % 30);
        for (auto& p : peaks) p = below(rng);
        ASSERT_EQ(gate.classify(windowWithPeaks(peaks)), VoiceActivityGate::Decision::Silence);
    }
}

TEST(BandpassFilterTest, PassesSpeechBandAndRejectsRumbleAndHiss) {
    const int rate = 16000;
    const double amplitude = 10000.0;

    auto settledPeak = [&](double hz) {
        BandpassFilter filter(rate, BandpassFilter::Config{});
        auto warm = sineBuffer(rate / 2, rate, hz, amplitude);
        filter.processPeak(warm.data(), (int)warm.size());
        auto tail = sineBuffer(rate / 2, rate, hz, amplitude, rate / 2);
        return filter.processPeak(tail.data(), (int)tail.size());
    };

    EXPECT_GT(settledPeak(1000.0), 0.9 * amplitude);
    EXPECT_LT(settledPeak(50.0), 0.1 * amplitude);
    EXPECT_LT(settledPeak(7000.0), 0.5 * amplitude);
}

TEST(BandpassFilterTest, ResetClearsRinging) {
    BandpassFilter filter(16000, BandpassFilter::Config{});
    auto loud = sineBuffer(1600, 16000, 1000.0, 20000.0);
    filter.processPeak(loud.data(), (int)loud.size());

    filter.reset();
    std::vector<int16_t> silence(1600, 0);
    EXPECT_EQ(filter.processPeak(silence.data(), (int)silence.size()), 0.0f);
}
