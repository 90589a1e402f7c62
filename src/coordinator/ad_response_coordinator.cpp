#include "coordinator/ad_response_coordinator.h"

#include "logging/logger.h"

#include <utility>

namespace ad_silencer::coordinator {

std::string_view responseModeToString(ResponseMode mode) {
    switch (mode) {
    case ResponseMode::Simple:
        return "simple";
    case ResponseMode::Filler:
        return "filler";
    }
    return "unknown";
}

AdResponseCoordinator::AdResponseCoordinator(detector::StateTracker& tracker,
                                             mixer::MuteController& muteController)
    : tracker_(tracker), muteController_(muteController), mode_(ResponseMode::Simple) {}

AdResponseCoordinator::AdResponseCoordinator(detector::StateTracker& tracker,
                                             mixer::MuteController& muteController,
                                             filler::FillerOrchestrator& orchestrator,
                                             filler::FillerOrchestrator::AdEndCallback onAdEnd)
    : tracker_(tracker),
      muteController_(muteController),
      orchestrator_(&orchestrator),
      onAdEnd_(std::move(onAdEnd)),
      mode_(ResponseMode::Filler) {}

void AdResponseCoordinator::onMetadata(const player::TrackMetadata& metadata) {
    handle(tracker_.observe(metadata.artist, metadata.title));
}

void AdResponseCoordinator::handle(const detector::Observation& observation) {
    if (!observation.changed) {
        return;
    }

    const auto& state = observation.newState;
    if (state.isAd) {
        LOG_INFO("[Coordinator] Ad detected (title='{}')", state.title);
    } else {
        LOG_DEBUG("[Coordinator] Now playing '{}' by '{}'", state.title, state.artist);
    }

    if (mode_ == ResponseMode::Filler) {
        handleFiller(observation);
    } else {
        handleSimple(observation);
    }
}

void AdResponseCoordinator::handleSimple(const detector::Observation& observation) {
    if (observation.newState.isAd) {
        auto rc = muteController_.mute();
        if (rc != core::ErrorCode::OK) {
            LOG_DEBUG("[Coordinator] Mute skipped ({})", core::errorCodeToString(rc));
        }
        return;
    }
    if (observation.oldState.isAd) {
        LOG_INFO("[Coordinator] Ad finished");
        auto rc = muteController_.unmute();
        if (rc != core::ErrorCode::OK) {
            LOG_DEBUG("[Coordinator] Unmute skipped ({})", core::errorCodeToString(rc));
        }
    }
}

void AdResponseCoordinator::handleFiller(const detector::Observation& observation) {
    if (!observation.newState.isAd) {
        // Resume and unmute belong to the running filler job.
        return;
    }
    if (orchestrator_->isRunning()) {
        LOG_DEBUG("[Coordinator] Filler already running");
        return;
    }
    if (!orchestrator_->tryStart(onAdEnd_)) {
        LOG_DEBUG("[Coordinator] Filler not started");
    }
}

void AdResponseCoordinator::restoreOnShutdown() {
    if (mode_ == ResponseMode::Filler) {
        orchestrator_->stop();
        return;
    }
    if (tracker_.current().isAd) {
        LOG_INFO("[Coordinator] Unmuting before exit");
        auto rc = muteController_.unmute();
        if (rc != core::ErrorCode::OK) {
            LOG_DEBUG("[Coordinator] Unmute skipped ({})", core::errorCodeToString(rc));
        }
    }
}

}  // namespace ad_silencer::coordinator
