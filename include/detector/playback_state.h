#pragma once

#include <string>

namespace ad_silencer::detector {

// Snapshot of what the endpoint reported last, plus its classification.
struct PlaybackState {
    std::string artist;
    std::string title;
    bool isAd = false;

    bool operator==(const PlaybackState& other) const {
        return artist == other.artist && title == other.title && isAd == other.isAd;
    }
    bool operator!=(const PlaybackState& other) const {
        return !(*this == other);
    }
};

}  // namespace ad_silencer::detector
