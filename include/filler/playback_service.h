#pragma once

#include "core/error_codes.h"

#include <string>

namespace ad_silencer::filler {

// Plays one audio file in the background.
class PlaybackService {
   public:
    virtual ~PlaybackService() = default;

    // Returns once playback has been started (or failed to start).
    virtual core::ErrorCode start(const std::string& path) = 0;

    // Total length of the current clip; 0.0 until the output has been primed.
    virtual double durationSeconds() const = 0;

    // Halts playback and releases the output. Idempotent.
    virtual void stop() = 0;
};

}  // namespace ad_silencer::filler
