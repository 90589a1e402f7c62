#include "audio/audio_io.h"
#include "support/temp_dir.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sndfile.h>
#include <vector>

namespace fs = std::filesystem;
using ad_silencer::audio::AudioFileReader;

class AudioFileReaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        tempDir = ad_silencer::testing::makeTestTempDir("audio_file_reader");
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    // Half a second of stereo silence at 48 kHz
    fs::path writeWav(const std::string& name) {
        fs::path path = tempDir / name;
        SF_INFO info{};
        info.samplerate = 48000;
        info.channels = 2;
        info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
        SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
        EXPECT_NE(file, nullptr);
        if (file) {
            std::vector<float> frames(24000 * 2, 0.0f);
            sf_writef_float(file, frames.data(), 24000);
            sf_close(file);
        }
        return path;
    }
};

TEST_F(AudioFileReaderTest, ReportsFormatAndDuration) {
    auto path = writeWav("clip.wav");
    AudioFileReader reader;

    ASSERT_TRUE(reader.open(path.string()));
    EXPECT_EQ(reader.getSampleRate(), 48000);
    EXPECT_EQ(reader.getChannels(), 2);
    EXPECT_EQ(reader.getFrames(), 24000);
    EXPECT_DOUBLE_EQ(reader.durationSeconds(), 0.5);
}

TEST_F(AudioFileReaderTest, ReadsBlocksUntilEndOfFile) {
    auto path = writeWav("clip.wav");
    AudioFileReader reader;
    ASSERT_TRUE(reader.open(path.string()));

    std::vector<float> block;
    sf_count_t total = 0;
    sf_count_t n = 0;
    while ((n = reader.readBlock(block, 4096)) > 0) {
        EXPECT_EQ(block.size(), static_cast<size_t>(n) * 2);
        total += n;
    }
    EXPECT_EQ(n, 0);
    EXPECT_EQ(total, 24000);
}

TEST_F(AudioFileReaderTest, RejectsNonAudioFile) {
    fs::path path = tempDir / "notes.txt";
    std::ofstream(path) << "not audio";

    AudioFileReader reader;
    EXPECT_FALSE(reader.open(path.string()));
    EXPECT_FALSE(reader.isOpen());
    EXPECT_DOUBLE_EQ(reader.durationSeconds(), 0.0);
}

TEST_F(AudioFileReaderTest, ReadBeforeOpenFails) {
    AudioFileReader reader;
    std::vector<float> block;
    EXPECT_EQ(reader.readBlock(block, 16), -1);
}
