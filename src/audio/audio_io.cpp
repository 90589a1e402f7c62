#include "audio/audio_io.h"

#include "logging/logger.h"

#include <cstring>

namespace ad_silencer::audio {

AudioFileReader::AudioFileReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

AudioFileReader::~AudioFileReader() {
    close();
}

bool AudioFileReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));

    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("[AudioFileReader] Cannot open {}: {}", filename, sf_strerror(nullptr));
        return false;
    }
    if (info_.channels <= 0 || info_.samplerate <= 0) {
        LOG_ERROR("[AudioFileReader] {} reports no usable stream (rate={}, channels={})",
                  filename, info_.samplerate, info_.channels);
        close();
        return false;
    }

    LOG_DEBUG("[AudioFileReader] Opened {} ({} Hz, {} ch, {:.2f} s)", filename, info_.samplerate,
              info_.channels, durationSeconds());
    return true;
}

void AudioFileReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

double AudioFileReader::durationSeconds() const {
    if (!file_ || info_.samplerate <= 0 || info_.frames <= 0) {
        return 0.0;
    }
    return static_cast<double>(info_.frames) / info_.samplerate;
}

sf_count_t AudioFileReader::readBlock(std::vector<float>& buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("[AudioFileReader] Read before open");
        return -1;
    }

    buffer.resize(static_cast<size_t>(frames) * static_cast<size_t>(info_.channels));
    sf_count_t framesRead = sf_readf_float(file_, buffer.data(), frames);
    if (framesRead < 0) {
        LOG_ERROR("[AudioFileReader] Decode failed: {}", sf_strerror(file_));
        return -1;
    }
    buffer.resize(static_cast<size_t>(framesRead) * static_cast<size_t>(info_.channels));
    return framesRead;
}

}  // namespace ad_silencer::audio
