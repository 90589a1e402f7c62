#pragma once

#include <sndfile.h>
#include <string>
#include <vector>

namespace ad_silencer::audio {

// Decodes any container libsndfile understands into interleaved float frames.
class AudioFileReader {
   public:
    AudioFileReader();
    ~AudioFileReader();

    AudioFileReader(const AudioFileReader&) = delete;
    AudioFileReader& operator=(const AudioFileReader&) = delete;

    bool open(const std::string& filename);
    void close();

    bool isOpen() const {
        return file_ != nullptr;
    }
    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    // 0.0 when the file is not open or reports no length
    double durationSeconds() const;

    // Reads up to `frames` frames into buffer (resized as needed). Returns the
    // number of frames read; 0 at end of file, -1 on error.
    sf_count_t readBlock(std::vector<float>& buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

}  // namespace ad_silencer::audio
