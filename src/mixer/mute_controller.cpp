#include "mixer/mute_controller.h"

#include "logging/logger.h"

#include <utility>
#include <vector>

namespace ad_silencer::mixer {

MuteController::MuteController(MixerService& mixer, std::string applicationName)
    : mixer_(mixer), applicationName_(std::move(applicationName)) {}

core::ErrorCode MuteController::mute() {
    return apply(true);
}

core::ErrorCode MuteController::unmute() {
    return apply(false);
}

core::ErrorCode MuteController::apply(bool muted) {
    const char* action = muted ? "mute" : "unmute";

    std::vector<uint32_t> streams;
    auto rc = mixer_.resolveStreams(applicationName_, streams);
    if (rc != core::ErrorCode::OK) {
        LOG_DEBUG("[MuteController] {} skipped, no stream for '{}' ({})", action,
                  applicationName_, core::errorCodeToString(rc));
        return rc;
    }

    core::ErrorCode result = core::ErrorCode::OK;
    for (uint32_t index : streams) {
        auto streamRc = mixer_.setMute(index, muted);
        if (streamRc != core::ErrorCode::OK) {
            LOG_DEBUG("[MuteController] {} of stream #{} failed ({})", action, index,
                      core::errorCodeToString(streamRc));
            result = streamRc;
            continue;
        }
        LOG_DEBUG("[MuteController] {} stream #{} ('{}')", action, index, applicationName_);
    }
    return result;
}

}  // namespace ad_silencer::mixer
