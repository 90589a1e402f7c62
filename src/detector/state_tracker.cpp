#include "detector/state_tracker.h"

#include "logging/logger.h"

#include <utility>

namespace ad_silencer::detector {

StateTracker::StateTracker(const AdClassifier& classifier) : classifier_(classifier) {}

Observation StateTracker::observe(const std::string& artist, const std::string& title) {
    PlaybackState candidate{artist, title, classifier_.isAd(artist, title)};

    Observation result;
    if (candidate == current_) {
        result.newState = current_;
        result.oldState = previous_;
        return result;
    }

    previous_ = current_;
    current_ = std::move(candidate);

    result.changed = true;
    result.newState = current_;
    result.oldState = previous_;
    LOG_DEBUG("[StateTracker] '{}' - '{}' (ad={}) -> '{}' - '{}' (ad={})", previous_.artist,
              previous_.title, previous_.isAd, current_.artist, current_.title, current_.isAd);
    return result;
}

}  // namespace ad_silencer::detector
