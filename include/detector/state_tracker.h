#pragma once

#include "detector/ad_classifier.h"
#include "detector/playback_state.h"

#include <string>

namespace ad_silencer::detector {

struct Observation {
    bool changed = false;
    PlaybackState newState;
    PlaybackState oldState;
};

// Debounces the metadata stream. MPRIS players publish several
// PropertiesChanged signals per track change; only the first one that differs
// from the current state counts.
class StateTracker {
   public:
    explicit StateTracker(const AdClassifier& classifier = defaultClassifier());

    Observation observe(const std::string& artist, const std::string& title);

    const PlaybackState& current() const {
        return current_;
    }
    const PlaybackState& previous() const {
        return previous_;
    }

   private:
    const AdClassifier& classifier_;
    PlaybackState current_;
    PlaybackState previous_;
};

}  // namespace ad_silencer::detector
