#pragma once

#include "core/error_codes.h"
#include "mixer/mixer_service.h"

#include <string>

namespace ad_silencer::mixer {

// Mutes and unmutes the tracked endpoint's output stream(s).
// Failures are recoverable: they are logged at debug level and the command is
// skipped for this invocation.
class MuteController {
   public:
    MuteController(MixerService& mixer, std::string applicationName);

    core::ErrorCode mute();
    core::ErrorCode unmute();

    const std::string& applicationName() const {
        return applicationName_;
    }

   private:
    core::ErrorCode apply(bool muted);

    MixerService& mixer_;
    std::string applicationName_;
};

}  // namespace ad_silencer::mixer
