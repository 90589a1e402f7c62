#include "filler/filler_orchestrator.h"
#include "support/fake_services.h"
#include "support/temp_dir.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>

namespace fs = std::filesystem;
using namespace ad_silencer;
using namespace std::chrono_literals;
using ad_silencer::testing::FakeMixer;
using ad_silencer::testing::FakePlayback;

class FillerOrchestratorTest : public ::testing::Test {
   protected:
    static constexpr uint32_t kStream = 7;

    // Initialized first: the library below is bound to it.
    fs::path tempDir = ad_silencer::testing::makeTestTempDir("filler_orchestrator");

    void SetUp() override {
        mixer_.addStream(kStream, "Spotify");
    }

    void TearDown() override {
        orchestrator_.stop();
        fs::remove_all(tempDir);
    }

    void addClip(const std::string& name) {
        std::ofstream file(tempDir / name);
        file << "clip";
    }

    filler::FillerOrchestrator::AdEndCallback countingCallback() {
        return [this]() {
            ++adEndCalls_;
            auto commands = mixer_.snapshot();
            mutedAtAdEnd_ = !commands.empty() && commands.back().muted;
        };
    }

    FakeMixer mixer_;
    FakePlayback playback_;
    mixer::MuteController muteController_{mixer_, "Spotify"};
    filler::FillerLibrary library_{tempDir, [](std::size_t) { return std::size_t{0}; }};
    filler::FillerOrchestrator orchestrator_{muteController_, library_, playback_, 10ms};
    std::atomic<int> adEndCalls_{0};
    std::atomic<bool> mutedAtAdEnd_{false};
};

TEST_F(FillerOrchestratorTest, JobMutesPlaysResumesThenUnmutes) {
    addClip("jingle.wav");

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));

    EXPECT_FALSE(orchestrator_.isRunning());
    EXPECT_EQ(playback_.startCalls, 1);
    EXPECT_EQ(playback_.stopCalls, 1);
    EXPECT_EQ(fs::path(playback_.lastPath).filename().string(), "jingle.wav");
    EXPECT_EQ(adEndCalls_.load(), 1);
    EXPECT_TRUE(mutedAtAdEnd_.load());

    auto commands = mixer_.snapshot();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_TRUE(commands.front().muted);
    EXPECT_FALSE(commands.back().muted);
    EXPECT_FALSE(mixer_.isMuted(kStream));
}

TEST_F(FillerOrchestratorTest, SecondAdWhileRunningIsDropped) {
    addClip("jingle.wav");
    playback_.duration = 0.3;

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    EXPECT_TRUE(orchestrator_.isRunning());
    EXPECT_FALSE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));

    EXPECT_EQ(playback_.startCalls, 1);
    EXPECT_EQ(adEndCalls_.load(), 1);
}

TEST_F(FillerOrchestratorTest, GuardIsFreeAfterEveryJob) {
    addClip("jingle.wav");

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
        ASSERT_TRUE(orchestrator_.waitForIdle(5s));
        EXPECT_FALSE(mixer_.isMuted(kStream));
    }
    EXPECT_EQ(adEndCalls_.load(), 3);
}

TEST_F(FillerOrchestratorTest, EmptyDirectoryStillUnmutesAndReleases) {
    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));

    EXPECT_EQ(playback_.startCalls, 0);
    EXPECT_EQ(adEndCalls_.load(), 0);
    auto commands = mixer_.snapshot();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_FALSE(commands.back().muted);
    EXPECT_TRUE(orchestrator_.tryStart(countingCallback()));
}

TEST_F(FillerOrchestratorTest, PlaybackFailureStillUnmutesAndReleases) {
    addClip("broken.wav");
    playback_.failStart = true;

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));

    EXPECT_EQ(playback_.startCalls, 1);
    EXPECT_EQ(adEndCalls_.load(), 0);
    EXPECT_FALSE(mixer_.isMuted(kStream));
    EXPECT_FALSE(orchestrator_.isRunning());
}

TEST_F(FillerOrchestratorTest, ExceptionInJobStillUnmutesAndReleases) {
    addClip("jingle.wav");
    playback_.throwOnStart = true;

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));

    EXPECT_FALSE(mixer_.isMuted(kStream));
    EXPECT_FALSE(orchestrator_.isRunning());
}

TEST_F(FillerOrchestratorTest, LatePrimedClipStillGetsFullWait) {
    addClip("jingle.wav");
    playback_.duration = 0.4;
    playback_.primeDelay = 150ms;

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator_.waitForIdle(5s));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 350ms);
    EXPECT_LT(elapsed, 3s);
    EXPECT_EQ(adEndCalls_.load(), 1);
    EXPECT_TRUE(mutedAtAdEnd_.load());
    EXPECT_FALSE(mixer_.isMuted(kStream));
}

TEST_F(FillerOrchestratorTest, ClipThatNeverPrimesIsTreatedAsFailedPlayback) {
    addClip("silent.wav");
    playback_.duration = 0.0;
    filler::FillerOrchestrator orchestrator{muteController_, library_, playback_, 10ms, 100ms};

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(orchestrator.tryStart(countingCallback()));
    ASSERT_TRUE(orchestrator.waitForIdle(5s));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(playback_.stopCalls, 1);
    EXPECT_EQ(adEndCalls_.load(), 0);
    EXPECT_FALSE(mixer_.isMuted(kStream));
}

TEST_F(FillerOrchestratorTest, StopWhileWaitingForPrimeStillUnmutes) {
    addClip("jingle.wav");
    playback_.duration = 1.0;
    playback_.primeDelay = 60s;

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    for (int i = 0; i < 200 && !playback_.playing.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(playback_.playing.load());

    auto start = std::chrono::steady_clock::now();
    orchestrator_.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(orchestrator_.isRunning());
    EXPECT_FALSE(mixer_.isMuted(kStream));
}

TEST_F(FillerOrchestratorTest, StopCutsWaitShortButStillResumesAndUnmutes) {
    addClip("long.wav");
    playback_.duration = 60.0;

    ASSERT_TRUE(orchestrator_.tryStart(countingCallback()));
    for (int i = 0; i < 200 && !playback_.playing.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(playback_.playing.load());

    auto start = std::chrono::steady_clock::now();
    orchestrator_.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_FALSE(orchestrator_.isRunning());
    EXPECT_EQ(adEndCalls_.load(), 1);
    EXPECT_FALSE(mixer_.isMuted(kStream));
    EXPECT_FALSE(orchestrator_.tryStart(countingCallback()));
}
