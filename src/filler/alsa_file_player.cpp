#include "filler/alsa_file_player.h"

#include "logging/logger.h"

#include <cerrno>
#include <chrono>
#include <memory>
#include <utility>
#include <vector>

namespace ad_silencer::filler {

namespace {

constexpr snd_pcm_uframes_t DEFAULT_PERIOD_FRAMES = 1024;
constexpr snd_pcm_uframes_t DEFAULT_BUFFER_FRAMES = DEFAULT_PERIOD_FRAMES * 4;

struct HwParamsDeleter {
    void operator()(snd_pcm_hw_params_t* p) const {
        if (p) {
            snd_pcm_hw_params_free(p);
        }
    }
};

}  // namespace

AlsaFilePlayer::AlsaFilePlayer(std::string device) : device_(std::move(device)) {}

AlsaFilePlayer::~AlsaFilePlayer() {
    stop();
}

bool AlsaFilePlayer::configureHardware(unsigned int sampleRate, unsigned int channels) {
    std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter> params;
    snd_pcm_hw_params_t* raw = nullptr;
    snd_pcm_hw_params_malloc(&raw);
    params.reset(raw);
    if (!params) {
        LOG_ERROR("[AlsaFilePlayer] Failed to alloc hw_params");
        return false;
    }

    if (snd_pcm_hw_params_any(handle_, params.get()) < 0) {
        LOG_ERROR("[AlsaFilePlayer] snd_pcm_hw_params_any failed");
        return false;
    }
    if (snd_pcm_hw_params_set_access(handle_, params.get(), SND_PCM_ACCESS_RW_INTERLEAVED) < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to set interleaved access");
        return false;
    }
    if (snd_pcm_hw_params_set_format(handle_, params.get(), SND_PCM_FORMAT_FLOAT_LE) < 0) {
        LOG_ERROR("[AlsaFilePlayer] {} does not accept FLOAT_LE", device_);
        return false;
    }
    if (snd_pcm_hw_params_set_channels(handle_, params.get(), channels) < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to set channels={}", channels);
        return false;
    }

    unsigned int rate = sampleRate;
    if (snd_pcm_hw_params_set_rate_near(handle_, params.get(), &rate, nullptr) < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to set rate={}", sampleRate);
        return false;
    }
    if (rate != sampleRate) {
        LOG_ERROR("[AlsaFilePlayer] Rate mismatch (requested {}, got {})", sampleRate, rate);
        return false;
    }

    snd_pcm_uframes_t period = DEFAULT_PERIOD_FRAMES;
    if (snd_pcm_hw_params_set_period_size_near(handle_, params.get(), &period, nullptr) < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to set period size");
        return false;
    }
    snd_pcm_uframes_t buffer = DEFAULT_BUFFER_FRAMES;
    if (snd_pcm_hw_params_set_buffer_size_near(handle_, params.get(), &buffer) < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to set buffer size");
        return false;
    }

    if (snd_pcm_hw_params(handle_, params.get()) < 0) {
        LOG_ERROR("[AlsaFilePlayer] snd_pcm_hw_params apply failed");
        return false;
    }

    snd_pcm_hw_params_get_period_size(params.get(), &period, nullptr);
    snd_pcm_hw_params_get_buffer_size(params.get(), &buffer);
    periodSize_ = period;
    bufferSize_ = buffer;
    return true;
}

core::ErrorCode AlsaFilePlayer::start(const std::string& path) {
    stop();

    if (!reader_.open(path)) {
        return core::ErrorCode::PLAYBACK_FILE_OPEN_FAILED;
    }

    int rc = snd_pcm_open(&handle_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (rc < 0) {
        LOG_ERROR("[AlsaFilePlayer] Failed to open device {}: {}", device_, snd_strerror(rc));
        handle_ = nullptr;
        reader_.close();
        return core::ErrorCode::PLAYBACK_DEVICE_OPEN_FAILED;
    }

    if (!configureHardware(static_cast<unsigned int>(reader_.getSampleRate()),
                           static_cast<unsigned int>(reader_.getChannels()))) {
        closeDevice();
        reader_.close();
        return core::ErrorCode::PLAYBACK_DEVICE_OPEN_FAILED;
    }

    duration_ = reader_.durationSeconds();
    stopRequested_.store(false, std::memory_order_release);
    primed_.store(false, std::memory_order_release);
    thread_ = std::thread(&AlsaFilePlayer::playbackLoop, this);

    LOG_INFO("[AlsaFilePlayer] Playing {} on {} (period={}, buffer={})", path, device_,
             periodSize_, bufferSize_);
    return core::ErrorCode::OK;
}

double AlsaFilePlayer::durationSeconds() const {
    return primed_.load(std::memory_order_acquire) ? duration_ : 0.0;
}

bool AlsaFilePlayer::recoverFromXrun(int err) {
    int rc = snd_pcm_recover(handle_, err, 1);
    if (rc < 0) {
        LOG_ERROR("[AlsaFilePlayer] XRUN recover failed: {}", snd_strerror(rc));
        return false;
    }
    LOG_WARN("[AlsaFilePlayer] XRUN recovered");
    return true;
}

bool AlsaFilePlayer::write(const float* data, snd_pcm_uframes_t frames) {
    const float* ptr = data;
    snd_pcm_uframes_t framesLeft = frames;
    const auto channels = static_cast<std::size_t>(reader_.getChannels());

    while (framesLeft > 0 && !stopRequested_.load(std::memory_order_acquire)) {
        snd_pcm_sframes_t written = snd_pcm_writei(handle_, ptr, framesLeft);
        if (written == -EPIPE || written == -ESTRPIPE) {
            if (!recoverFromXrun(static_cast<int>(written))) {
                return false;
            }
            continue;
        }
        if (written == -EINTR || written == -EAGAIN) {
            continue;
        }
        if (written < 0) {
            LOG_ERROR("[AlsaFilePlayer] Write failed: {}", snd_strerror(static_cast<int>(written)));
            return false;
        }
        framesLeft -= static_cast<snd_pcm_uframes_t>(written);
        ptr += static_cast<std::size_t>(written) * channels;
    }
    return true;
}

void AlsaFilePlayer::playbackLoop() {
    std::vector<float> block;
    const auto blockFrames = static_cast<sf_count_t>(periodSize_ > 0 ? periodSize_
                                                                      : DEFAULT_PERIOD_FRAMES);
    bool completed = false;

    while (!stopRequested_.load(std::memory_order_acquire)) {
        sf_count_t framesRead = reader_.readBlock(block, blockFrames);
        if (framesRead < 0) {
            break;
        }
        if (framesRead == 0) {
            completed = true;
            break;
        }
        if (!write(block.data(), static_cast<snd_pcm_uframes_t>(framesRead))) {
            break;
        }
        primed_.store(true, std::memory_order_release);
    }

    if (completed && !stopRequested_.load(std::memory_order_acquire)) {
        snd_pcm_drain(handle_);
        LOG_DEBUG("[AlsaFilePlayer] Clip finished");
    }
}

void AlsaFilePlayer::closeDevice() {
    if (!handle_) {
        return;
    }
    snd_pcm_drop(handle_);
    snd_pcm_close(handle_);
    handle_ = nullptr;
    periodSize_ = 0;
    bufferSize_ = 0;
}

void AlsaFilePlayer::stop() {
    stopRequested_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
    const bool wasOpen = handle_ != nullptr;
    closeDevice();
    reader_.close();
    primed_.store(false, std::memory_order_release);
    duration_ = 0.0;
    if (wasOpen) {
        LOG_DEBUG("[AlsaFilePlayer] Closed {}", device_);
    }
}

}  // namespace ad_silencer::filler
