#pragma once

#include "audio/audio_io.h"
#include "filler/playback_service.h"

#include <alsa/asoundlib.h>
#include <atomic>
#include <string>
#include <thread>

namespace ad_silencer::filler {

// Decodes a clip with libsndfile and writes it to an ALSA PCM from a dedicated
// thread. The device is opened per clip and closed by stop().
class AlsaFilePlayer : public PlaybackService {
   public:
    explicit AlsaFilePlayer(std::string device);
    ~AlsaFilePlayer() override;

    AlsaFilePlayer(const AlsaFilePlayer&) = delete;
    AlsaFilePlayer& operator=(const AlsaFilePlayer&) = delete;

    core::ErrorCode start(const std::string& path) override;
    double durationSeconds() const override;
    void stop() override;

   private:
    bool configureHardware(unsigned int sampleRate, unsigned int channels);
    bool write(const float* data, snd_pcm_uframes_t frames);
    bool recoverFromXrun(int err);
    void playbackLoop();
    void closeDevice();

    std::string device_;
    snd_pcm_t* handle_{nullptr};
    snd_pcm_uframes_t periodSize_{0};
    snd_pcm_uframes_t bufferSize_{0};
    audio::AudioFileReader reader_;
    std::thread thread_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> primed_{false};
    double duration_{0.0};
};

}  // namespace ad_silencer::filler
